#pragma once
#include "datadrift/MockSftpClient.hpp"
#include "datadrift/SessionManager.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace datadrift {
namespace test {

SessionOptions mockOptions(const std::string& user = "u");

SessionManager::ClientFactory mockFactory(std::shared_ptr<MockRemoteFs> fs);

// Scratch directory under $TMPDIR, removed with its contents on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

void writeLocal(const std::string& path, const std::string& content);
std::string readLocal(const std::string& path);
bool localExists(const std::string& path);
std::vector<std::string> localNames(const std::string& dir);

// Polls pred until it holds or the timeout expires.
bool waitUntil(const std::function<bool()>& pred,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

// Deterministic binary payload.
std::string pattern(std::size_t size, unsigned seed = 7);

bool hasPartFile(const std::vector<std::string>& names);

} // namespace test
} // namespace datadrift

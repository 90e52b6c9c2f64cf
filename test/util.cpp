#include "util.hpp"
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <fstream>
#include <ftw.h>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>

namespace datadrift {
namespace test {

SessionOptions mockOptions(const std::string& user) {
    SessionOptions opt;
    opt.host = "h";
    opt.username = user;
    opt.password = std::string("pw");
    return opt;
}

SessionManager::ClientFactory mockFactory(std::shared_ptr<MockRemoteFs> fs) {
    return [fs]() -> std::unique_ptr<SftpClient> { return std::make_unique<MockSftpClient>(fs); };
}

TempDir::TempDir() {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string(base && *base ? base : "/tmp") + "/datadrift-test-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed for " + tmpl);
    path_ = buf.data();
}

TempDir::~TempDir() {
    ::nftw(path_.c_str(),
           [](const char* p, const struct stat*, int, struct FTW*) { return std::remove(p); },
           16, FTW_DEPTH | FTW_PHYS);
}

void writeLocal(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) throw std::runtime_error("cannot write " + path);
}

std::string readLocal(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool localExists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

std::vector<std::string> localNames(const std::string& dir) {
    std::vector<std::string> out;
    DIR* d = ::opendir(dir.c_str());
    if (!d) return out;
    while (dirent* e = ::readdir(d)) {
        const std::string n = e->d_name;
        if (n != "." && n != "..") out.push_back(n);
    }
    ::closedir(d);
    return out;
}

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

std::string pattern(std::size_t size, unsigned seed) {
    std::string s(size, '\0');
    unsigned v = seed;
    for (std::size_t i = 0; i < size; ++i) {
        v = v * 1103515245u + 12345u;
        s[i] = (char)(v >> 16);
    }
    return s;
}

bool hasPartFile(const std::vector<std::string>& names) {
    for (const auto& n : names) {
        if (n.size() > 5 && n.compare(n.size() - 5, 5, ".part") == 0) return true;
    }
    return false;
}

} // namespace test
} // namespace datadrift

#include "datadrift/RemotePath.hpp"
#include <vector>

namespace datadrift {
namespace remotepath {

std::string normalize(const std::string& path) {
    const bool abs = isAbsolute(path);
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= path.size()) {
        std::size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        std::string seg = path.substr(i, j - i);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") parts.pop_back();
            else if (!abs) parts.push_back(seg);
        } else {
            parts.push_back(seg);
        }
        i = j + 1;
    }
    std::string out = abs ? "/" : "";
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k) out += '/';
        out += parts[k];
    }
    if (out.empty()) out = ".";
    return out;
}

std::string resolve(const std::string& base, const std::string& path) {
    if (path.empty()) return normalize(base.empty() ? "/" : base);
    if (isAbsolute(path)) return normalize(path);
    return normalize(join(base.empty() ? "/" : base, path));
}

std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string parent(const std::string& path) {
    const std::string n = normalize(path);
    if (n == "/" || n == ".") return n;
    const std::size_t pos = n.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return n.substr(0, pos);
}

std::string baseName(const std::string& path) {
    const std::string n = normalize(path);
    if (n == "/") return std::string();
    const std::size_t pos = n.rfind('/');
    return pos == std::string::npos ? n : n.substr(pos + 1);
}

} // namespace remotepath
} // namespace datadrift

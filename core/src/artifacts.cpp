#include "scriptbox/artifacts.h"
#include "scriptbox/ids.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace scriptbox {

namespace {

bool is_path_under(const fs::path& p, const fs::path& root) {
    std::error_code ec;
    auto rp = fs::weakly_canonical(p, ec);
    if (ec) return false;
    auto rr = fs::weakly_canonical(root, ec);
    if (ec) return false;
    auto ps = rp.generic_string();
    auto rs = rr.generic_string();
    if (!rs.empty() && rs.back() != '/') rs.push_back('/');
    return ps.rfind(rs, 0) == 0;
}

// lstat-style: a symlink is never the thing it points at.
bool is_type_no_follow(const fs::path& p, fs::file_type want) {
    std::error_code ec;
    fs::file_status st = fs::symlink_status(p, ec);
    return !ec && st.type() == want;
}

} // namespace

std::string artifact_resource(const std::string& ns, const std::string& execution_id,
                              const std::string& filename) {
    return ns + "/" + execution_id + "/" + filename;
}

std::vector<std::string> collect_artifacts(const fs::path& out_dir,
                                           const std::string& execution_id,
                                           const SandboxPolicy& policy) {
    std::vector<std::string> names;
    std::error_code ec;
    if (fs::is_directory(out_dir, ec)) {
        for (fs::directory_iterator it(out_dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code fec;
            if (it->symlink_status(fec).type() != fs::file_type::regular || fec) continue;
            const fs::path& p = it->path();
            if (p.extension() != policy.artifact_extension) continue;
            names.push_back(p.filename().string());
        }
        if (ec) {
            std::cerr << "[sandbox][WARN] cannot list " << out_dir << ": " << ec.message() << "\n";
            names.clear();
        }
    }
    std::sort(names.begin(), names.end());

    if (names.empty()) {
        std::error_code rec;
        fs::remove_all(out_dir, rec);
        if (rec) {
            std::cerr << "[sandbox][WARN] cannot remove empty output dir " << out_dir << ": "
                      << rec.message() << "\n";
        }
        return {};
    }

    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& n : names) out.push_back(artifact_resource(policy.resource_namespace, execution_id, n));
    return out;
}

std::optional<fs::path> resolve_artifact(const SandboxPolicy& policy, const std::string& resource) {
    const std::string prefix = policy.resource_namespace + "/";
    if (resource.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

    const std::string rest = resource.substr(prefix.size());
    const size_t slash = rest.find('/');
    if (slash == std::string::npos) return std::nullopt;

    const std::string id = rest.substr(0, slash);
    const std::string name = rest.substr(slash + 1);
    if (!is_execution_id(id)) return std::nullopt;
    if (name.empty() || name[0] == '.') return std::nullopt;
    if (name.find_first_of("/\\") != std::string::npos) return std::nullopt;
    if (name.find('\0') != std::string::npos) return std::nullopt;
    if (fs::path(name).extension() != policy.artifact_extension) return std::nullopt;

    const fs::path dir = policy.output_root / id;
    const fs::path file = dir / name;
    if (!is_type_no_follow(dir, fs::file_type::directory)) return std::nullopt;
    if (!is_type_no_follow(file, fs::file_type::regular)) return std::nullopt;
    if (!is_path_under(file, dir)) return std::nullopt;
    return file;
}

std::optional<std::string> read_artifact(const fs::path& file) {
    int fd = ::open(file.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) return std::nullopt;
    struct stat st{};
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return std::nullopt;
    }
    std::string data;
    data.reserve((size_t)st.st_size);
    char buf[65536];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            data.append(buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            ::close(fd);
            return std::nullopt;
        }
        break;
    }
    ::close(fd);
    return data;
}

const char* content_type_for(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".gif") return "image/gif";
    if (ext == ".pdf") return "application/pdf";
    return "application/octet-stream";
}

} // namespace scriptbox

#include <exflow/analysis/source_discovery.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace exflow::analysis {

namespace fs = std::filesystem;

std::vector<fs::path> discoverSourceFiles(const fs::path& root, std::string_view extension) {
    std::vector<fs::path> files;
    std::error_code ec;

    if (fs::is_regular_file(root, ec)) {
        files.push_back(root);
        return files;
    }
    if (!fs::is_directory(root, ec)) {
        spdlog::debug("[Discovery] {} is neither a file nor a directory", root.string());
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("[Discovery] cannot scan {}: {}", root.string(), ec.message());
        return files;
    }

    for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("[Discovery] skipping entry under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && it->path().extension() == extension) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    spdlog::debug("[Discovery] {} source file(s) under {}", files.size(), root.string());
    return files;
}

Result<std::string> readSourceFile(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError,
                     fmt::format("cannot open file: {}", std::strerror(errno))};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IOError, "failed while reading file"};
    }
    return buffer.str();
}

} // namespace exflow::analysis

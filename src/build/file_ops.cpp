#include "build/file_ops.hpp"

#include <fstream>
#include <sstream>

namespace twbuild::build {

Result<std::string, BuildError> read_text_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return BuildError::make(BuildErrorKind::Io, "cannot open file for reading", path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return BuildError::make(BuildErrorKind::Io, "failed while reading file", path);
    }
    return buffer.str();
}

Result<size_t, BuildError> write_text_file(const fs::path& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return BuildError::make(BuildErrorKind::Io, "cannot open file for writing", path);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return BuildError::make(BuildErrorKind::Io, "failed while writing file", path);
    }
    return content.size();
}

Result<uintmax_t, BuildError> copy_file_over(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return BuildError::io("cannot copy " + from.string(), to, ec);
    }
    auto size = fs::file_size(to, ec);
    if (ec) {
        return BuildError::io("cannot stat copied file", to, ec);
    }
    return size;
}

bool path_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

} // namespace twbuild::build

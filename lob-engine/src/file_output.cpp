#include "lob/file_output.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace lob {

static bool write_all(const std::filesystem::path& p, const std::string& data) {
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::cerr << "[final] failed to open: " << p.string() << "\n";
        return false;
    }
    ofs.write(data.data(), (std::streamsize)data.size());
    ofs.close();
    if (!ofs) {
        std::cerr << "[final] failed to write: " << p.string() << "\n";
        return false;
    }
    return true;
}

bool write_file_atomic_like(const std::string& path, const std::string& data) {
    const std::filesystem::path out(path);

    std::error_code ec;
    if (out.has_parent_path()) {
        std::filesystem::create_directories(out.parent_path(), ec);
    }

    auto tmp = out;
    tmp += ".tmp";
    if (!write_all(tmp, data)) return false;

    std::filesystem::rename(tmp, out, ec);
    if (ec) {
        // fallback: direct write, then drop the temp file
        if (!write_all(out, data)) return false;
        std::filesystem::remove(tmp, ec);
    }

    std::cerr << "[final] wrote " << out.string()
              << " (" << data.size() << " bytes)\n";
    return true;
}

} // namespace lob

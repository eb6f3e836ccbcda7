#include "session/upload_store.hpp"
#include "core/errors.hpp"
#include "util/clock.hpp"

#include <cctype>
#include <fstream>
#include <iostream>

namespace fchat::session {

std::string safe_extension(const std::string& name)
{
    const std::string ext = std::filesystem::path(name).extension().string();
    std::string out;
    for (char c : ext) {
        if (out.size() >= 16) break;
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.') out.push_back(c);
    }
    return out;
}

std::filesystem::path save_upload(const std::filesystem::path& dir,
                                  const std::string& original_name,
                                  const std::vector<uint8_t>& bytes)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        throw Error("cannot create " + dir.string() + ": " + ec.message());

    const std::string stem = util::file_stamp();
    const std::string ext  = safe_extension(original_name);

    auto path = dir / (stem + ext);
    for (int n = 1; std::filesystem::exists(path); ++n)
        path = dir / (stem + "-" + std::to_string(n) + ext);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw Error("cannot create " + path.string());
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
        throw Error("write failed for " + path.string());

    std::cout << "[UPLOAD] File reconstructed: " << path.string()
              << " (" << bytes.size() << " bytes)\n";
    return path;
}

} // namespace fchat::session

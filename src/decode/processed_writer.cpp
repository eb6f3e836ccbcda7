#include "decode/processed_writer.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <iostream>
#include <memory>

#include <json/json.h>

namespace fchat::decode {

std::filesystem::path write_processed(const core::DecodedRecordSet& records,
                                      const std::filesystem::path& dir,
                                      const std::filesystem::path& source)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        throw DecodeFailure("cannot create " + dir.string() + ": " + ec.message());

    const auto out_path = dir / (source.stem().string() + "_processed.json");

    std::ofstream out(out_path, std::ios::trunc);
    if (!out)
        throw DecodeFailure("cannot write " + out_path.string());

    Json::StreamWriterBuilder wb;
    wb["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(wb.newStreamWriter());
    writer->write(records.to_json(), &out);
    out << '\n';

    if (!out)
        throw DecodeFailure("write failed for " + out_path.string());

    std::cout << "[DECODE] Created processed file: " << out_path.string() << '\n';
    return out_path;
}

} // namespace fchat::decode

// src/data/feather_loader.cpp

#include "canslim_bt/data/feather_loader.hpp"
#include <arrow/io/file.h>
#include <arrow/ipc/feather.h>
#include "canslim_bt/core/logger.hpp"

namespace canslim_bt {

Result<std::shared_ptr<arrow::Table>> load_feather_table(const std::string& path) {
    using TablePtr = std::shared_ptr<arrow::Table>;

    auto file = arrow::io::ReadableFile::Open(path);
    if (!file.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_NOT_FOUND,
                                    "Cannot open " + path + ": " + file.status().ToString(),
                                    "FeatherLoader");
    }

    auto reader = arrow::ipc::feather::Reader::Open(*file);
    if (!reader.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Not a Feather file " + path + ": " +
                                        reader.status().ToString(),
                                    "FeatherLoader");
    }

    TablePtr table;
    auto status = (*reader)->Read(&table);
    if (!status.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to read " + path + ": " + status.ToString(),
                                    "FeatherLoader");
    }

    INFO("Loaded " << table->num_rows() << " row(s) from " << path);
    return table;
}

}  // namespace canslim_bt

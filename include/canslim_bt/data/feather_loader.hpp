// include/canslim_bt/data/feather_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include "canslim_bt/core/error.hpp"

namespace canslim_bt {

/**
 * @brief Read a Feather (Arrow IPC) file into a table
 * @return FILE_NOT_FOUND when the file cannot be opened, FILE_IO_ERROR when it cannot be read
 */
Result<std::shared_ptr<arrow::Table>> load_feather_table(const std::string& path);

}  // namespace canslim_bt

#pragma once

#include "roi_types.h"

#include <QByteArray>
#include <QString>

#include <filesystem>
#include <vector>

namespace roithumb::roi_io {

// Load rois from JSON array [{id, boundary: [[row, col], ...], classification}, ...].
bool loadJson(const std::filesystem::path& jsonPath,
              std::vector<Roi>& out,
              QString* error = nullptr);

// Parse rois from an in-memory JSON document in the same format.
bool parseJson(const QByteArray& bytes,
               std::vector<Roi>& out,
               QString* error = nullptr);

}  // namespace roithumb::roi_io

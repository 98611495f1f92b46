#include "roi_io.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <cmath>
#include <utility>

namespace fs = std::filesystem;

namespace roithumb::roi_io {

namespace {

void closePolygonIfNeeded(Roi& roi) {
    if (roi.boundary.size() < 3) return;
    const cv::Vec2d d = roi.boundary.front() - roi.boundary.back();
    if (std::hypot(d[0], d[1]) <= 1e-6) return;
    roi.boundary.push_back(roi.boundary.front());
}

}  // namespace

bool parseJson(const QByteArray& bytes, std::vector<Roi>& out, QString* error) {
    out.clear();

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        if (error) *error = parseErr.errorString();
        return false;
    }
    if (doc.isNull()) {
        return true;
    }
    if (!doc.isArray()) {
        if (error) *error = "JSON root is not an array";
        return false;
    }

    const QJsonArray arr = doc.array();
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.isObject()) continue;
        const QJsonObject obj = v.toObject();

        Roi roi;
        roi.id = obj.value("id").toString().trimmed();
        if (roi.id.isEmpty()) {
            roi.id = QString("roi_%1").arg(static_cast<int>(out.size()) + 1, 4, 10, QChar('0'));
        }
        roi.classification = obj.value("classification").toString();

        const QJsonValue bv = obj.value("boundary");
        if (bv.isArray()) {
            const QJsonArray pointsArr = bv.toArray();
            roi.boundary.reserve(pointsArr.size());
            for (const auto& p : pointsArr) {
                if (!p.isArray()) continue;
                const QJsonArray pa = p.toArray();
                if (pa.size() < 2) continue;
                roi.boundary.emplace_back(pa.at(0).toDouble(), pa.at(1).toDouble());
            }
        }
        if (roi.boundary.size() < 3) continue;
        closePolygonIfNeeded(roi);

        out.push_back(std::move(roi));
    }

    return true;
}

bool loadJson(const fs::path& jsonPath, std::vector<Roi>& out, QString* error) {
    out.clear();

    QFile f(QString::fromStdString(jsonPath.string()));
    if (!f.open(QIODevice::ReadOnly)) {
        if (error) *error = "Failed to open JSON for reading";
        return false;
    }
    const QByteArray bytes = f.readAll();
    f.close();

    return parseJson(bytes, out, error);
}

}  // namespace roithumb::roi_io

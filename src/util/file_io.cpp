#include "util/file_io.hpp"

#include <QFile>
#include <QSaveFile>

namespace folio::util {

std::optional<QByteArray> read_file_bytes(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return f.readAll();
}

Res<void> write_bytes_atomic(const QString& path, const QByteArray& bytes) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Res<void>::err(make_error(ErrorCode::FileWriteFailed,
                                         path.toStdString() + ": " + file.errorString().toStdString()));
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return Res<void>::err(make_error(ErrorCode::FileWriteFailed,
                                         path.toStdString() + ": short write"));
    }
    if (!file.commit()) {
        return Res<void>::err(make_error(ErrorCode::FileWriteFailed,
                                         path.toStdString() + ": " + file.errorString().toStdString()));
    }
    return Res<void>::ok();
}

Res<void> write_bytes_atomic(const QString& path, std::string_view bytes) {
    return write_bytes_atomic(path, QByteArray(bytes.data(), static_cast<qsizetype>(bytes.size())));
}

Res<void> write_bytes_atomic(const QString& path, std::span<const uint8_t> bytes) {
    return write_bytes_atomic(path, QByteArray(reinterpret_cast<const char*>(bytes.data()),
                                               static_cast<qsizetype>(bytes.size())));
}

} // namespace folio::util

#pragma once
#include <QByteArray>
#include <QString>

#include <chrono>

namespace Medgate
{
class UploadStore;

// Bytes of the image an imageUrl form field points to: one of our uploads,
// a local path or file:// URL, or a plain http:// URL.
// Throws RequestError when the image cannot be obtained.
QByteArray loadImageUrl(
    const QString& url,
    const UploadStore& uploads,
    qint64 maxBytes,
    std::chrono::seconds timeout = std::chrono::seconds{15});

QByteArray httpGet(const QString& url, qint64 maxBytes, std::chrono::seconds timeout);
}

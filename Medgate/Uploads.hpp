#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QString>

#include <optional>
#include <vector>

namespace Medgate
{
struct StoredUpload
{
  QString fileName;
  QString path;
  QString url;
};

struct UploadEntry
{
  QString fileName;
  QString url;
  QDateTime uploadTime;
};

// Uploaded files named <epoch-ms>-<original name>, served back under
// <publicBase>/uploads/<name>.
class UploadStore
{
public:
  UploadStore(const QString& directory, QString publicBase);

  // Throws std::runtime_error if the file cannot be written.
  StoredUpload
  save(const QString& originalName, const QByteArray& data, const QString& prefix = {});

  // Image files only, newest first.
  std::vector<UploadEntry> list() const;

  // Absolute path of a stored file, nothing if it does not exist or escapes
  // the directory.
  std::optional<QString> resolve(const QString& fileName) const;

  // Maps a URL of this server's /uploads/ route back to a file name.
  std::optional<QString> fileNameFromUrl(const QString& url) const;

  QString urlFor(const QString& fileName) const;
  const QDir& directory() const noexcept { return m_dir; }

  static QString sanitize(const QString& originalName);
  static bool isImageName(const QString& fileName);

private:
  QDir m_dir;
  QString m_publicBase;
};
}

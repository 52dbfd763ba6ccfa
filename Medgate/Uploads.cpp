#include "Uploads.hpp"

#include <QFile>
#include <QFileInfo>
#include <QUrl>

#include <Medgate/Logging.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace Medgate
{
UploadStore::UploadStore(const QString& directory, QString publicBase)
    : m_dir{directory}
    , m_publicBase{std::move(publicBase)}
{
  if (!m_dir.exists() && !QDir().mkpath(m_dir.absolutePath()))
    throw std::runtime_error(std::format(
        "Could not create the uploads directory {}",
        m_dir.absolutePath().toStdString()));
  m_dir.makeAbsolute();
  while (m_publicBase.endsWith(QLatin1Char('/')))
    m_publicBase.chop(1);
}

QString UploadStore::sanitize(const QString& originalName)
{
  QString name = QFileInfo(originalName).fileName();
  for (QChar& c : name)
  {
    if (!(c.isLetterOrNumber() && c.unicode() < 128) && c != QLatin1Char('.')
        && c != QLatin1Char('-') && c != QLatin1Char('_'))
      c = QLatin1Char('_');
  }
  while (name.startsWith(QLatin1Char('.')))
    name.remove(0, 1);
  if (name.isEmpty())
    name = QStringLiteral("upload");
  return name;
}

bool UploadStore::isImageName(const QString& fileName)
{
  static const QString extensions[]
      = {QStringLiteral("jpg"),
         QStringLiteral("jpeg"),
         QStringLiteral("png"),
         QStringLiteral("gif"),
         QStringLiteral("webp")};
  const QString suffix = QFileInfo(fileName).suffix().toLower();
  return std::ranges::find(extensions, suffix) != std::end(extensions);
}

StoredUpload
UploadStore::save(const QString& originalName, const QByteArray& data, const QString& prefix)
{
  const QString base = sanitize(originalName);
  const qint64 now = QDateTime::currentMSecsSinceEpoch();

  for (int attempt = 0; attempt < 100; attempt++)
  {
    const QString name
        = attempt == 0
              ? QStringLiteral("%1%2-%3").arg(prefix).arg(now).arg(base)
              : QStringLiteral("%1%2-%3-%4").arg(prefix).arg(now).arg(attempt).arg(base);

    QFile file(m_dir.filePath(name));
    if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly))
    {
      if (file.exists())
        continue;
      throw std::runtime_error(std::format(
          "Could not write {}: {}",
          file.fileName().toStdString(),
          file.errorString().toStdString()));
    }

    if (file.write(data) != data.size())
    {
      file.remove();
      throw std::runtime_error(std::format(
          "Could not write {}", file.fileName().toStdString()));
    }

    qCInfo(lcUploads) << "Stored" << name << data.size() << "bytes";
    return {name, file.fileName(), urlFor(name)};
  }
  throw std::runtime_error("Could not find a free upload file name");
}

std::vector<UploadEntry> UploadStore::list() const
{
  std::vector<UploadEntry> entries;
  const auto files = m_dir.entryInfoList(QDir::Files, QDir::Time);
  for (const QFileInfo& info : files)
  {
    if (!isImageName(info.fileName()))
      continue;
    entries.push_back({info.fileName(), urlFor(info.fileName()), info.lastModified()});
  }
  return entries;
}

std::optional<QString> UploadStore::resolve(const QString& fileName) const
{
  if (fileName.isEmpty() || fileName.contains(QLatin1Char('/'))
      || fileName.contains(QLatin1Char('\\')) || fileName == QLatin1String(".")
      || fileName == QLatin1String(".."))
    return std::nullopt;

  const QFileInfo info(m_dir.filePath(fileName));
  if (!info.isFile())
    return std::nullopt;

  const QString canonical = info.canonicalFilePath();
  const QString root = m_dir.canonicalPath() + QLatin1Char('/');
  if (!canonical.startsWith(root))
    return std::nullopt;
  return canonical;
}

std::optional<QString> UploadStore::fileNameFromUrl(const QString& url) const
{
  const QUrl parsed(url);
  const QUrl base(m_publicBase);
  const QString host = parsed.host();
  const bool local
      = parsed.isRelative()
        || (parsed.port(80) == base.port(80)
            && (host == base.host() || host == QLatin1String("localhost")
                || host == QLatin1String("127.0.0.1")));
  if (!local)
    return std::nullopt;

  static const QString route = QStringLiteral("/uploads/");
  const QString path = parsed.path();
  if (!path.startsWith(route))
    return std::nullopt;

  const QString name = path.mid(route.size());
  if (name.isEmpty() || name.contains(QLatin1Char('/')))
    return std::nullopt;
  return name;
}

QString UploadStore::urlFor(const QString& fileName) const
{
  return m_publicBase + QStringLiteral("/uploads/") + fileName;
}
}

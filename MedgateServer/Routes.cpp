#include "Routes.hpp"

#include "FormData.hpp"
#include "ImageSource.hpp"
#include "Responder.hpp"
#include "ServerContext.hpp"

#include <Medgate/Config.hpp>
#include <Medgate/Errors.hpp>
#include <Medgate/Generation.hpp>
#include <Medgate/InferenceQueue.hpp>
#include <Medgate/Logging.hpp>
#include <Medgate/ModelHost.hpp>
#include <Medgate/Ocr.hpp>
#include <Medgate/Uploads.hpp>
#include <Medgate/helpers/Audio.hpp>

#include <QJsonArray>
#include <QMimeDatabase>
#include <QUrl>

namespace Medgate::Http
{
namespace
{
using http::status;

std::string_view headerValue(const Request& req, http::field f)
{
  const auto it = req.find(f);
  if (it == req.end())
    return {};
  return {it->value().data(), it->value().size()};
}

FormData readForm(const Request& req)
{
  return FormData::parse(headerValue(req, http::field::content_type), req.body());
}

std::string toStd(const QString& s)
{
  return s.toStdString();
}

void generate(ServerContext& ctx, const Request& req, Responder& out)
{
  const FormData form = readForm(req);
  const QString text = form.text(u"text");
  const QString imageUrlField = form.text(u"imageUrl").trimmed();
  const FormPart* imageFile = form.file(u"image");
  const FormPart* audioFile = form.file(u"audio");
  const FormPart* history = form.field(u"conversation");

  if (imageFile && imageFile->data.isEmpty())
    imageFile = nullptr;
  if (audioFile && audioFile->data.isEmpty())
    audioFile = nullptr;

  qCInfo(lcHttp).nospace() << "Generate request: "
                           << (text.isEmpty() ? "no text" : "with text") << ", "
                           << (imageFile ? "uploaded image"
                               : imageUrlField.isEmpty() ? "no image"
                                                         : "image URL")
                           << ", " << (audioFile ? "with audio" : "no audio");

  if (text.isEmpty() && imageUrlField.isEmpty() && !imageFile && !audioFile)
    throw RequestError("Please provide text, an image, or an audio file.");

  GenerationJob job;
  QString imageUrl;
  if (imageFile)
  {
    job.image = decodeImage(imageFile->data);
  }
  else if (!imageUrlField.isEmpty())
  {
    qCInfo(lcHttp) << "Loading image from" << imageUrlField;
    job.image = decodeImage(
        loadImageUrl(imageUrlField, ctx.uploads, ctx.config.maxBodyBytes));
    imageUrl = imageUrlField;
  }

  if (audioFile)
  {
    qCInfo(lcAudio) << "Decoding uploaded audio" << audioFile->fileName;
    job.audio = Audio::loadMono(audioFile->data, Gemma::GemmaInference::samplingRate);
  }

  const auto normalized = normalizeConversation(
      history ? parseHistory(history->data) : std::vector<ConversationTurn>{},
      NewUserTurn{toStd(text), job.image.has_value(), !job.audio.empty()});
  job.conversation = normalized.turns;

  auto& model = ctx.host.visionLanguage();
  const auto ticket = ctx.queue.acquire();

  // Stored once the request is admitted, a rejected one leaves no file.
  if (imageFile)
  {
    const auto stored = ctx.uploads.save(imageFile->fileName, imageFile->data);
    imageUrl = stored.url;
    qCInfo(lcUploads) << "Image accessible at" << imageUrl;
  }

  if (!imageUrl.isEmpty())
  {
    job.metadata = QJsonObject{
        {QStringLiteral("imageUrl"), imageUrl},
        {QStringLiteral("message"), QStringLiteral("Processing...\n\n")}};
    job.completeFields = QJsonObject{{QStringLiteral("imageUrl"), imageUrl}};
  }

  GenerationSession session{
      model, out, GenerationOptions{.maxNewTokens = ctx.config.maxNewTokens}};
  session.run(job);
}

void ocrGenerate(ServerContext& ctx, const Request& req, Responder& out)
{
  const FormData form = readForm(req);
  const FormPart* imageFile = form.file(u"image");
  const QString prompt = form.text(u"prompt").trimmed();

  if (!imageFile || imageFile->data.isEmpty())
    throw RequestError("Please provide an image file for OCR processing.");
  if (prompt.isEmpty())
    throw RequestError("Please provide a prompt to combine with the OCR text.");

  qCInfo(lcOcr) << "OCR request for" << imageFile->fileName;
  auto& model = ctx.host.visionLanguage();

  std::string extracted;
  try
  {
    extracted = ctx.ocr.recognize(imageFile->data);
  }
  catch (const std::exception& e)
  {
    qCWarning(lcOcr) << "Text recognition failed:" << e.what();
    throw HttpError(500, "An internal server error occurred during OCR processing.");
  }

  const QString extractedText = QString::fromStdString(extracted);
  qCInfo(lcOcr) << "Extracted" << extractedText.size() << "characters";
  if (extractedText.isEmpty())
    qCInfo(lcOcr) << "No text found in the image";
  else
    qCDebug(lcOcr).noquote() << "Extracted text:" << extractedText.left(200);

  const auto ticket = ctx.queue.acquire();
  const auto stored
      = ctx.uploads.save(imageFile->fileName, imageFile->data, QStringLiteral("ocr-"));

  GenerationJob job;
  job.conversation = ocrConversation(extracted, toStd(prompt));
  job.completeFields = QJsonObject{
      {QStringLiteral("imageUrl"), stored.url},
      {QStringLiteral("extractedText"), extractedText},
      {QStringLiteral("extractedTextLength"), extractedText.size()}};
  job.metadata = job.completeFields;
  job.metadata->insert(
      QStringLiteral("message"),
      QStringLiteral("OCR completed, generating response...\n\n"));
  job.failureMessage
      = QStringLiteral("An internal server error occurred during OCR processing.");

  GenerationSession session{
      model, out, GenerationOptions{.maxNewTokens = ctx.config.maxNewTokens}};
  session.run(job);
}

void poseEstimation(ServerContext& ctx, const Request& req, Responder& out)
{
  const FormData form = readForm(req);
  const FormPart* imageFile = form.file(u"image");
  if (!imageFile || imageFile->data.isEmpty())
    throw RequestError("No image file uploaded.");

  const auto& pose = ctx.host.pose();
  QByteArray jpeg;
  try
  {
    jpeg = pose.estimate(imageFile->data);
  }
  catch (const HttpError&)
  {
    throw;
  }
  catch (const std::exception& e)
  {
    qCWarning(lcPose) << "Pose estimation failed:" << e.what();
    throw HttpError(500, "An internal server error occurred during pose estimation.");
  }
  out.bytes(status::ok, "image/jpeg", jpeg);
}

void health(ServerContext& ctx, Responder& out)
{
  const auto h = ctx.host.health();
  const QJsonObject vision{
      {QStringLiteral("loaded"), h.visionReady},
      {QStringLiteral("path"), ctx.config.visionDir}};
  const QJsonObject pose{
      {QStringLiteral("loaded"), h.poseReady},
      {QStringLiteral("path"), ctx.config.poseFile}};

  // gemma_vision and pose_estimation are the names the desktop client reads.
  out.json(
      status::ok,
      QJsonObject{
          {QStringLiteral("status"), QStringLiteral("ok")},
          {QStringLiteral("message"), QStringLiteral("AI Core is online.")},
          {QStringLiteral("models"),
           QJsonObject{
               {QStringLiteral("vision"), vision},
               {QStringLiteral("pose"), pose},
               {QStringLiteral("gemma_vision"), vision},
               {QStringLiteral("pose_estimation"), pose}}}});
}

void modelInfo(ServerContext& ctx, Responder& out)
{
  const auto h = ctx.host.health();
  const auto& c = ctx.config;
  out.json(
      status::ok,
      QJsonObject{
          {QStringLiteral("gemma"),
           QJsonObject{
               {QStringLiteral("path"), c.visionDir},
               {QStringLiteral("loaded"), h.visionReady},
               {QStringLiteral("provider"), c.provider},
               {QStringLiteral("maxNewTokens"), c.maxNewTokens}}},
          {QStringLiteral("pose"),
           QJsonObject{
               {QStringLiteral("path"), c.poseFile},
               {QStringLiteral("loaded"), h.poseReady},
               {QStringLiteral("inputWidth"), c.poseInputWidth},
               {QStringLiteral("inputHeight"), c.poseInputHeight}}}});
}

void listUploads(ServerContext& ctx, Responder& out)
{
  QJsonArray images;
  for (const auto& entry : ctx.uploads.list())
  {
    images.append(QJsonObject{
        {QStringLiteral("filename"), entry.fileName},
        {QStringLiteral("url"), entry.url},
        {QStringLiteral("uploadTime"),
         entry.uploadTime.toUTC().toString(Qt::ISODateWithMs)}});
  }
  out.json(status::ok, QJsonObject{{QStringLiteral("images"), images}});
}

void serveUpload(ServerContext& ctx, const QString& encodedName, bool headOnly, Responder& out)
{
  const QString name = QUrl::fromPercentEncoding(encodedName.toUtf8());
  const auto path = ctx.uploads.resolve(name);
  if (!path)
  {
    out.error(status::not_found, QStringLiteral("Not found"));
    return;
  }

  static const QMimeDatabase mimes;
  const auto type = mimes.mimeTypeForFile(*path, QMimeDatabase::MatchExtension);
  out.file(*path, type.name().toStdString(), headOnly);
}

void dispatch(ServerContext& ctx, const Request& req, Responder& out)
{
  std::string_view target{req.target().data(), req.target().size()};
  if (const auto q = target.find('?'); q != target.npos)
    target = target.substr(0, q);

  const auto method = req.method();
  if (method == http::verb::options)
  {
    out.empty(status::no_content);
    return;
  }

  const bool get = method == http::verb::get || method == http::verb::head;
  if (method == http::verb::post)
  {
    if (target == "/generate")
      return generate(ctx, req, out);
    if (target == "/ocrgenerate")
      return ocrGenerate(ctx, req, out);
    if (target == "/pose-estimation")
      return poseEstimation(ctx, req, out);
  }
  else if (get)
  {
    if (target == "/health")
      return health(ctx, out);
    if (target == "/model-info")
      return modelInfo(ctx, out);
    if (target == "/uploads/list")
      return listUploads(ctx, out);

    constexpr std::string_view prefix = "/uploads/";
    if (target.starts_with(prefix) && target.size() > prefix.size())
    {
      const auto name = target.substr(prefix.size());
      return serveUpload(
          ctx,
          QString::fromUtf8(name.data(), qsizetype(name.size())),
          method == http::verb::head,
          out);
    }
  }

  out.error(status::not_found, QStringLiteral("Not found"));
}
}

void handleRequest(ServerContext& ctx, const Request& req, Responder& out)
{
  qCDebug(lcHttp).noquote() << QString::fromStdString(std::string(req.method_string()))
                            << QString::fromStdString(std::string(req.target()));
  try
  {
    dispatch(ctx, req, out);
  }
  catch (const HttpError& e)
  {
    qCInfo(lcHttp) << "Request rejected with" << e.status() << ":" << e.what();
    if (!out.responded())
      out.error(static_cast<status>(e.status()), QString::fromUtf8(e.what()));
  }
  catch (const std::exception& e)
  {
    qCWarning(lcHttp) << "Request failed:" << e.what();
    if (!out.responded())
      out.error(
          status::internal_server_error,
          QStringLiteral("An internal server error occurred."));
  }
}
}

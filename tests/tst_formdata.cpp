#include <QTest>

#include <Medgate/Errors.hpp>

#include "FormData.hpp"

using namespace Medgate;
using namespace Medgate::Http;
using namespace std::literals;

class FormDataTest : public QObject
{
  Q_OBJECT

private slots:
  void boundaryFromContentType()
  {
    QCOMPARE(
        multipartBoundary("multipart/form-data; boundary=----abc123"),
        std::string_view("----abc123"));
    QCOMPARE(
        multipartBoundary("Multipart/Form-Data; charset=utf-8; Boundary=\"q q\""),
        std::string_view("q q"));
    QVERIFY(multipartBoundary("application/json").empty());
  }

  void parsesFieldsAndFiles()
  {
    const std::string body
        = "--XyZ\r\n"
          "Content-Disposition: form-data; name=\"text\"\r\n"
          "\r\n"
          "Describe this\r\n"
          "--XyZ\r\n"
          "Content-Disposition: form-data; name=\"image\"; filename=\"scan.png\"\r\n"
          "Content-Type: image/png\r\n"
          "\r\n"
          "\x89PNG\r\n\x1a\n\0data\r\n"s
          "--XyZ\r\n"
          "Content-Disposition: form-data; name=\"audio\"; filename=\"\"\r\n"
          "\r\n"
          "\r\n"
          "--XyZ--\r\n";

    const auto form = FormData::parse("multipart/form-data; boundary=XyZ", body);
    QCOMPARE(form.parts.size(), std::size_t(3));
    QCOMPARE(form.text(u"text"), QStringLiteral("Describe this"));

    const FormPart* image = form.file(u"image");
    QVERIFY(image);
    QCOMPARE(image->fileName, QStringLiteral("scan.png"));
    QCOMPARE(image->contentType, QStringLiteral("image/png"));
    QCOMPARE(image->data, QByteArray("\x89PNG\r\n\x1a\n\0data", 13));

    // An empty file input is still a file part, with no data.
    const FormPart* audio = form.file(u"audio");
    QVERIFY(audio);
    QVERIFY(audio->data.isEmpty());

    QVERIFY(!form.file(u"text"));
    QVERIFY(form.text(u"image").isEmpty());
    QVERIFY(!form.field(u"missing"));
  }

  void acceptsBareLineFeeds()
  {
    const std::string body
        = "--b1\n"
          "Content-Disposition: form-data; name=\"prompt\"\n"
          "\n"
          "Summarize\n"
          "--b1\n"
          "Content-Disposition: form-data; name=\"image\"; filename=\"page.jpg\"\n"
          "Content-Type: image/jpeg\n"
          "\n"
          "\xff\xd8\r\nJPEG\n"
          "--b1--\n";

    const auto form = FormData::parse("multipart/form-data; boundary=b1", body);
    QCOMPARE(form.parts.size(), std::size_t(2));
    QCOMPARE(form.text(u"prompt"), QStringLiteral("Summarize"));
    const FormPart* image = form.file(u"image");
    QVERIFY(image);
    QCOMPARE(image->fileName, QStringLiteral("page.jpg"));
    QCOMPARE(image->contentType, QStringLiteral("image/jpeg"));
    QCOMPARE(image->data, QByteArray("\xff\xd8\r\nJPEG"));
  }

  void emptyFileNameIsAnEmptyFilePart()
  {
    const std::string body
        = "--q\r\n"
          "Content-Disposition: form-data; name=\"image\"; filename=\"\"\r\n"
          "Content-Type: application/octet-stream\r\n"
          "\r\n"
          "\r\n"
          "--q\r\n"
          "Content-Disposition: form-data; name=\"text\"\r\n"
          "\r\n"
          "hi\r\n"
          "--q--";

    const auto form = FormData::parse("multipart/form-data; boundary=q", body);
    const FormPart* image = form.file(u"image");
    QVERIFY(image);
    QVERIFY(image->fileName.isEmpty());
    QVERIFY(image->data.isEmpty());
    QCOMPARE(image->contentType, QStringLiteral("application/octet-stream"));
    QCOMPARE(form.text(u"text"), QStringLiteral("hi"));
  }

  void malformedMultipartIsRejected()
  {
    QVERIFY_THROWS_EXCEPTION(
        RequestError,
        FormData::parse("multipart/form-data; boundary=XyZ", "no boundary here"));
    QVERIFY_THROWS_EXCEPTION(
        RequestError,
        FormData::parse(
            "multipart/form-data; boundary=XyZ",
            "--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nunterminated"));
    QVERIFY_THROWS_EXCEPTION(
        RequestError, FormData::parse("multipart/form-data", "--XyZ--"));
  }

  void parsesUrlEncoded()
  {
    const auto form = FormData::parse(
        "application/x-www-form-urlencoded",
        "text=hello+world%21&imageUrl=http%3A%2F%2Flocalhost%3A3010%2Fuploads%2Fa.png");
    QCOMPARE(form.text(u"text"), QStringLiteral("hello world!"));
    QCOMPARE(form.text(u"imageUrl"), QStringLiteral("http://localhost:3010/uploads/a.png"));
  }

  void otherContentTypesAreEmpty()
  {
    QVERIFY(FormData::parse("application/json", "{}").parts.empty());
  }
};

QTEST_GUILESS_MAIN(FormDataTest)
#include "tst_formdata.moc"

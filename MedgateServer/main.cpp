#include "Listener.hpp"
#include "ServerContext.hpp"
#include "SessionThreads.hpp"

#include <Medgate/Config.hpp>
#include <Medgate/Errors.hpp>
#include <Medgate/InferenceQueue.hpp>
#include <Medgate/Logging.hpp>
#include <Medgate/ModelHost.hpp>
#include <Medgate/Ocr.hpp>
#include <Medgate/Uploads.hpp>

#include <QCoreApplication>
#include <QTextStream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <csignal>
#include <cstdlib>
#include <future>
#include <thread>
#include <vector>

namespace
{
void logProgress(const Medgate::LoadProgress& p)
{
  if (p.bytesTotal > 0)
    qCInfo(Medgate::lcHost).nospace()
        << "Loading " << p.phase.c_str() << ": "
        << (100 * p.bytesLoaded / p.bytesTotal) << "%";
  else
    qCInfo(Medgate::lcHost) << "Loading" << p.phase.c_str();
}

bool wantsHelp(const QStringList& args)
{
  return args.contains(QStringLiteral("-h")) || args.contains(QStringLiteral("--help"))
         || args.contains(QStringLiteral("-?"));
}
}

int main(int argc, char** argv)
{
  using namespace Medgate;
  namespace net = boost::asio;

  QCoreApplication app{argc, argv};
  QCoreApplication::setApplicationName(QStringLiteral("medgate-server"));

  const QStringList args = QCoreApplication::arguments();
  if (wantsHelp(args))
  {
    QTextStream(stdout) << helpText();
    return EXIT_SUCCESS;
  }

  try
  {
    installLogging({}, args.contains(QStringLiteral("-v"))
                           || args.contains(QStringLiteral("--verbose")));
    const ServerConfig config = ServerConfig::fromArguments(args);
    installLogging(config.logRules, config.verbose);

    ModelHost host{config};
    host.initializeVisionLanguage(logProgress);

    InferenceQueue queue{std::size_t(config.queueMaxWaiting)};
    UploadStore uploads{config.uploadsDir, config.publicBaseUrl()};
    TesseractRecognizer ocr{config.tesseract, config.ocrLanguage};
    net::thread_pool posePool{std::size_t(config.poseThreads)};
    SessionThreads sessions;

    ServerContext ctx{
        .config = config,
        .host = host,
        .queue = queue,
        .uploads = uploads,
        .ocr = ocr,
        .posePool = posePool,
        .sessions = sessions};

    boost::system::error_code ec;
    const auto address = net::ip::make_address(config.host.toStdString(), ec);
    if (ec)
      throw StartupError("Invalid listen address: " + config.host.toStdString());

    net::io_context ioc{config.ioThreads};
    auto listener = std::make_shared<Listener>(
        ioc, net::ip::tcp::endpoint{address, config.port}, ctx);
    listener->run();

    std::promise<void> stopRequested;
    auto stopped = stopRequested.get_future();
    net::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& error, int sig) {
      if (error)
        return;
      qCInfo(lcHost) << "Signal" << sig << "received, shutting down";
      stopRequested.set_value();
    });

    std::vector<std::thread> threads;
    threads.reserve(std::size_t(config.ioThreads));
    for (int i = 0; i < config.ioThreads; i++)
      threads.emplace_back([&ioc] { ioc.run(); });

    // Session threads wait on the I/O threads for their writes, so they are
    // joined first. Everything they use lives in this scope.
    auto stopServer = [&] {
      listener->stop();
      sessions.stop();
      sessions.join();
      ioc.stop();
      for (auto& t : threads)
        t.join();
      posePool.join();
    };

    qCInfo(lcHttp).noquote() << "Server listening on"
                             << QStringLiteral("http://%1:%2").arg(config.host).arg(config.port);

    try
    {
      host.initializePose(logProgress);
      qCInfo(lcHost) << "All models loaded, the server is ready";
      qCInfo(lcHost).noquote() << "WebSocket endpoint:"
                               << QStringLiteral("ws://%1:%2").arg(config.publicHost).arg(config.port);
      qCInfo(lcHost).noquote() << "Uploads served from" << config.publicBaseUrl() + "/uploads/";
    }
    catch (const StartupError& e)
    {
      qCCritical(lcHost) << e.what();
      stopServer();
      return EXIT_FAILURE;
    }

    stopped.wait();
    stopServer();
    return EXIT_SUCCESS;
  }
  catch (const StartupError& e)
  {
    qCCritical(lcHost) << e.what();
    return EXIT_FAILURE;
  }
  catch (const std::exception& e)
  {
    qCCritical(lcHost) << "Fatal error:" << e.what();
    return EXIT_FAILURE;
  }
}

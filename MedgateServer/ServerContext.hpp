#pragma once
#include <boost/asio/thread_pool.hpp>

namespace Medgate
{
struct ServerConfig;
class ModelHost;
class InferenceQueue;
class UploadStore;
class TextRecognizer;
class SessionThreads;

// Everything a connection needs, owned by main().
struct ServerContext
{
  const ServerConfig& config;
  ModelHost& host;
  InferenceQueue& queue;
  UploadStore& uploads;
  TextRecognizer& ocr;
  boost::asio::thread_pool& posePool;
  SessionThreads& sessions;
};
}

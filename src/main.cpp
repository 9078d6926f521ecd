
// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "courier/async.hpp"
#include "courier/mq.hpp"
#include "courier/utils.hpp"

#include <boost/asio/io_context.hpp>

namespace courier {

namespace demo {
  struct AddRequest {
    int32_t x = 0;
    int32_t y = 0;
    template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
      ar("x", self.x)("y", self.y);
    }
  };

  struct AddResponse {
    int32_t x = 0;
    int32_t y = 0;
    int32_t sum = 0;
    template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
      ar("x", self.x)("y", self.y)("sum", self.sum);
    }
  };
} // namespace demo

static constexpr int k_max_grid_size = 1000;

static void show_help(const char* exec) {
  fmt::print(R"V0G0N(

   Usage: {} [OPTIONS...]

      -n <count>         Requests are a <count> x <count> grid of additions; default is 6,
                         at most 1000.
      -s <serializer>    Encode requests with <serializer>: json or binary.
      -D <key>=<value>   Set a configuration property, e.g.,
                         -D courier.proxies.calculator.channel.qos=4

   Runs a calculator server, and a client that sends it additions, over an
   in-process broker.

)V0G0N",
             exec);
}

int main(int argc, char** argv) {
  int grid_size = 6;
  std::string serializer_name{};
  mq::PropertyMap properties;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      if (arg == "-h" || arg == "--help") {
        show_help(argv[0]);
        return EXIT_SUCCESS;
      } else if (arg == "-n") {
        grid_size = cli::safe_arg_int(argc, argv, i);
      } else if (arg == "-s") {
        serializer_name = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "-D") {
        const auto assignment = cli::safe_arg_str(argc, argv, i);
        if (auto ec = mq::parse_assignment(properties, assignment))
          throw std::runtime_error(format("expected key=value, but got '{}'", assignment));
      } else {
        throw std::runtime_error(format("unexpected argument '{}'", arg));
      }
    }
  } catch (const std::runtime_error& e) {
    LOG_ERR("{}, pass -h for help", e.what());
    return EXIT_FAILURE;
  }

  if (grid_size < 1 || grid_size > k_max_grid_size) {
    LOG_ERR("grid size must be in [1..{}], got {}", k_max_grid_size, grid_size);
    return EXIT_FAILURE;
  }

  auto codec_config = mq::parse_codec_config(properties);
  auto endpoint = mq::load_endpoint(properties, "calculator");
  if (!codec_config || !endpoint) {
    LOG_ERR("invalid configuration");
    return EXIT_FAILURE;
  }

  auto registry = mq::SerializerRegistry::make_default();
  auto codec = std::make_shared<const mq::EnvelopeCodec>(registry, *codec_config);
  auto serializer =
      serializer_name.empty() ? codec->default_serializer() : registry->find(serializer_name);
  if (serializer == nullptr) {
    LOG_ERR("unknown serializer '{}'", serializer_name);
    return EXIT_FAILURE;
  }

  boost::asio::io_context io_context;
  async::AsioExecutionContext pool{io_context, 2};
  mq::LoopbackBroker broker{io_context};
  auto executor = pool.get_execution_broker();

  auto processor = std::make_shared<mq::ProxyProcessor<demo::AddRequest, demo::AddResponse>>(
      codec,
      [](const demo::AddRequest& request) {
        return demo::AddResponse{request.x, request.y, request.x + request.y};
      },
      executor);
  auto server = std::make_shared<mq::RpcServer>(io_context, broker.open_channel(), processor,
                                                mq::make_server_config(*endpoint));
  auto client = std::make_shared<mq::RpcClient>(io_context, broker.open_channel(),
                                                mq::make_client_config(*endpoint));

  pool.run();
  server->start();
  client->start();

  auto server_ready = server->when_connected();
  auto client_ready = client->when_connected();
  if (server_ready.wait_for(5s) != std::future_status::ready ||
      client_ready.wait_for(5s) != std::future_status::ready) {
    LOG_ERR("timed out connecting to the broker");
    return EXIT_FAILURE;
  }

  mq::RpcProxy proxy{client, codec, executor, serializer};

  std::vector<async::Future<mq::CallResult<demo::AddResponse>>> futures;
  futures.reserve(std::size_t(grid_size) * std::size_t(grid_size));
  for (int32_t x = 0; x < grid_size; ++x)
    for (int32_t y = 0; y < grid_size; ++y)
      futures.push_back(proxy.call<demo::AddResponse>(demo::AddRequest{x, y}));

  int failures = 0;
  for (auto& future : futures) {
    if (future.wait_for(5s) != std::future_status::ready) {
      LOG_ERR("timed out waiting for a reply");
      ++failures;
      continue;
    }
    try {
      auto result = future.get();
      if (const auto* reply = std::get_if<demo::AddResponse>(&result)) {
        fmt::print("{} + {} = {}\n", reply->x, reply->y, reply->sum);
      } else {
        WARN("request undelivered: {}", std::get<mq::Undelivered>(result).message.reply_text);
        ++failures;
      }
    } catch (const std::exception& e) {
      LOG_ERR("request failed: {}", e.what());
      ++failures;
    }
  }

  client->stop();
  server->stop();
  pool.stop();

  return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace courier

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return courier::main(argc, argv); }

#endif

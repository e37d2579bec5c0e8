// SPDX-License-Identifier: MIT

// example/dev_pipeline/main.cpp
//
// Builds a pipeline from a JSON config file and drives a few requests
// through it in-process:
//
//   dev_pipeline [config.json]
#include <cstdlib>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "lib/stream/log.hpp"
#include "lib/stream/pipeline.hpp"
#include "lib/stream/sink.hpp"
#include "lib/stream/stage_fn.hpp"
#include "src/config.hpp"
#include "src/live_reload.hpp"
#include "src/session_layer.hpp"

using namespace stage_pipe;

namespace {

std::expected<Response, Error> HandlePage(Request request) {
    Session* session = request.extensions.Get<Session>();
    int visits = 1;
    if (session) {
        visits = std::stoi(session->Get("visits").value_or("0")) + 1;
        session->Insert("visits", std::to_string(visits));
    }
    return MakeResponse(200,
                        fmt::format("<html><body>{} visit(s) to {}</body></html>",
                                    visits, request.Path()),
                        "text/html; charset=utf-8");
}

// Sink receiving the response; kept alive by the caller while a request is parked.
std::shared_ptr<ResultSink<Response>> Send(BoxedStage& pipeline, std::string target,
                                           std::optional<std::string>& cookie) {
    Request request;
    request.target = std::move(target);
    if (cookie) request.headers.Append("Cookie", *cookie);

    std::string path = request.target;
    auto sink = ResultSink<Response>::Create([path, &cookie](std::expected<Response, Error> result) {
        if (!result) {
            Logger()->error("{} failed: {}", path, DescribeChain(result.error()));
            return;
        }
        if (auto set = result->headers.Get("Set-Cookie")) {
            cookie = set->substr(0, set->find(';'));
        }
        auto body = result->body.Collect();
        if (!body) {
            Logger()->error("{} body failed: {}", path, body.error().message);
            return;
        }
        Logger()->info("{} -> {} ({} bytes)", path, result->status, body->size());
        Logger()->debug("{}", *body);
    });
    auto done = sink->Bind(request);
    Oneshot(pipeline, std::move(request), std::move(done));
    if (!sink->IsDelivered()) Logger()->info("{} is waiting", path);
    return sink;
}

}  // namespace

int main(int argc, char** argv) {
    ProjectConfig config;
    if (argc > 1) {
        auto loaded = LoadConfig(argv[1]);
        if (!loaded) {
            Logger()->error("{}", loaded.error().message);
            return EXIT_FAILURE;
        }
        config = *loaded;
    }
    if (config.debug) Logger()->set_level(spdlog::level::debug);

    LiveReloadLayer live_reload = LiveReloadLayer::FromConfig(config);
    BoxedStage pipeline = PipelineBuilder(MakeStage(HandlePage))
                              .Middleware(SessionLayer::FromConfig(config))
                              .Middleware(live_reload)
                              .Build();

    std::optional<std::string> cookie;
    Send(pipeline, "/", cookie);
    Send(pipeline, "/about", cookie);
    auto poll = Send(pipeline, live_reload.options().LongPollPath(), cookie);
    // A client that goes away: dropping its sink releases the parked poll.
    Send(pipeline, live_reload.options().LongPollPath(), cookie);
    if (live_reload.IsEnabled()) {
        Logger()->info("{} client(s) waiting for a reload", live_reload.reloader()->Pending());
    }

    if (live_reload.IsEnabled()) live_reload.reloader()->Reload();
    return EXIT_SUCCESS;
}

// apps/clockface_demo.cpp
// @brief Host wiring the event loop, the system clock and a text sink around
//        a ClockApp.
// @invariant Exits on SIGINT/SIGTERM, after CLOCKFACE_RUN_SECONDS, or when the
//            heartbeat fails; status 1 on any initialization failure.
// @ownership main owns the loop, the clocks, the sink and the app.

#include "clockface/app.hpp"
#include "clockface/config/config.hpp"
#include "clockface/draw/drawing.hpp"
#include "clockface/sched/event_loop.hpp"
#include "clockface/sched/monotonic_clock.hpp"
#include "clockface/support/log.hpp"
#include "clockface/support/result.hpp"
#include "clockface/time/time_source.hpp"
#include "clockface/version.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace
{
std::atomic<bool> g_stop{false};

/// Upper bound for CLOCKFACE_RUN_SECONDS (one year).
constexpr long long kMaxRunSeconds = 365LL * 24 * 60 * 60;

extern "C" void onSignal(int)
{
    g_stop.store(true);
}

/// Prints the whole drawing once, then only the named hands on each update.
class TextSink final : public clockface::DrawingSink
{
  public:
    explicit TextSink(std::ostream &os) : os_(os) {}

    void push(const clockface::draw::Drawing &drawing) override
    {
        if (first_)
        {
            os_ << clockface::draw::describe(drawing);
            first_ = false;
        }
        else
        {
            clockface::draw::Drawing hands;
            for (const auto &p : drawing.primitives())
            {
                if (!p.id.empty())
                {
                    hands.add(p);
                }
            }
            os_ << clockface::draw::describe(hands);
        }
        os_ << "--\n";
        os_.flush();
    }

  private:
    std::ostream &os_;
    bool first_ = true;
};

void usage(std::ostream &os)
{
    os << "usage: clockface_demo [--version] [config.ini]\n";
}
} // namespace

int main(int argc, char **argv)
{
    using namespace clockface;

    if (const char *v = std::getenv("CLOCKFACE_LOG_LEVEL"))
    {
        if (auto level = support::parseLogLevel(v))
        {
            support::setLogLevel(*level);
        }
        else
        {
            support::logWarn("ignoring unknown CLOCKFACE_LOG_LEVEL '" + std::string(v) + "'");
        }
    }

    std::string configPath;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--version")
        {
            std::cout << "clockface " << clockface_version() << '\n';
            return 0;
        }
        if (arg == "-h" || arg == "--help")
        {
            usage(std::cout);
            return 0;
        }
        if (!arg.empty() && arg[0] == '-')
        {
            usage(std::cerr);
            return 1;
        }
        configPath = std::string(arg);
    }

    config::ClockOptions options;
    if (!configPath.empty())
    {
        auto loaded = config::loadFromFile(configPath);
        if (!loaded)
        {
            support::printError(loaded.error(), std::cerr);
            return 1;
        }
        options = loaded.value();
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    sched::SteadyMonotonicClock monotonic;
    sched::EventLoop loop(monotonic);
    time::SystemTimeSource wallClock;
    TextSink sink(std::cout);

    auto created = ClockApp::create(options, loop, wallClock, sink);
    if (!created)
    {
        support::printError(created.error(), std::cerr);
        return 1;
    }
    ClockApp &app = *created.value();
    app.setFatalHandler([](const support::Error &) { g_stop.store(true); });

    if (const char *v = std::getenv("CLOCKFACE_RUN_SECONDS"))
    {
        const long long seconds = std::min(std::strtoll(v, nullptr, 10), kMaxRunSeconds);
        if (seconds > 0)
        {
            auto limit = loop.scheduleOnce(static_cast<std::int64_t>(seconds) * 1000,
                                           []() { g_stop.store(true); });
            if (!limit)
            {
                support::printError(limit.error(), std::cerr);
                return 1;
            }
        }
    }

    loop.run(g_stop);

    const int status = app.failure() ? 1 : 0;
    if (app.failure())
    {
        support::printError(*app.failure(), std::cerr);
    }
    app.stop();
    loop.shutdown();
    support::logInfo("clock demo exiting");
    return status;
}

// Sample plugin: a counting prompt plus two commands that inspect and reset it.
#include <atomic>
#include <string>
#include <plughost/plugins/plugin_sdk.hpp>

namespace {

std::atomic<uint64_t> g_counter{0};

plughost::sdk::Plugin makePlugin() {
    plughost::sdk::Plugin p("sample", "0.1.0");

    p.prompt([] { return std::to_string(g_counter++) + " $ "; });

    p.command({"reset-counter", "", {}, false, PLUGHOST_KIND_NONE, {},
               [](const plughost::sdk::Args&, plughost::sdk::Reply&) { g_counter = 0; }});

    p.command({"count", "[args...]", {}, true, PLUGHOST_KIND_STRING, {},
               [](const plughost::sdk::Args& args, plughost::sdk::Reply& reply) {
                   reply.string("you provided " + std::to_string(args.size()) + " arguments");
               }});

    p.command({"counter", "", {}, false, PLUGHOST_KIND_INT, {},
               [](const plughost::sdk::Args&, plughost::sdk::Reply& reply) {
                   reply.integer(static_cast<int64_t>(g_counter.load()));
               }});

    p.onInit([](const char*) {
        g_counter = 0;
        return true;
    });
    return p;
}

} // namespace

PLUGHOST_DEFINE_PLUGIN(makePlugin)

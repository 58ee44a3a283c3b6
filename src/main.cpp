#include "build/BuildPipeline.hpp"
#include "build/Config.hpp"
#include "build/Errors.hpp"
#include "build/Steps.hpp"
#include "sys/CommandRunner.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace build = gadgetimg::build;
namespace util = gadgetimg::util;

// Ctrl+C stops between steps; the checkpoint stays behind for --resume.
static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static void usage(std::FILE* out) {
  std::fprintf(out,
      "Usage: gadgetimg [options] <model.assertion>\n"
      "  -d, --workdir DIR   build in DIR and keep it (enables --resume)\n"
      "  -o, --output FILE   write the disk image to FILE\n"
      "  -c, --channel CH    snap channel (default: edge)\n"
      "  -r, --resume        continue the build checkpointed in --workdir\n"
      "  -u, --until STEP    stop before STEP\n"
      "  -t, --thru STEP     stop after STEP\n"
      "      --config FILE   configuration file (default: $GADGETIMG_CONFIG or\n"
      "                      ~/.config/gadgetimg/config.toml)\n"
      "      --debug         log every step and tool invocation\n"
      "  -h, --help          show this help\n");
}

static int usage_error(const std::string& message) {
  std::fprintf(stderr, "gadgetimg: %s\n", message.c_str());
  usage(stderr);
  return 2;
}

int main(int argc, char** argv) {
  std::string workdir, output, channel, config_path, model;
  std::optional<build::Step> until, thru;
  bool resume = false, debug = false, have_config = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= argc) return false;
      out = argv[++i];
      return true;
    };
    std::string v;
    if (a == "-h" || a == "--help") { usage(stdout); return 0; }
    else if (a == "-d" || a == "--workdir") { if (!value(workdir)) return usage_error(a + " needs a directory"); }
    else if (a == "-o" || a == "--output") { if (!value(output)) return usage_error(a + " needs a file"); }
    else if (a == "-c" || a == "--channel") { if (!value(channel)) return usage_error(a + " needs a channel"); }
    else if (a == "--config") { if (!value(config_path)) return usage_error(a + " needs a file"); have_config = true; }
    else if (a == "-r" || a == "--resume") resume = true;
    else if (a == "--debug") debug = true;
    else if (a == "-u" || a == "--until" || a == "-t" || a == "--thru") {
      if (!value(v)) return usage_error(a + " needs a step name");
      auto s = build::step_from_string(v);
      if (!s) return usage_error("unknown step '" + v + "'");
      (a == "-u" || a == "--until" ? until : thru) = *s;
    }
    else if (!a.empty() && a[0] == '-') return usage_error("unknown option '" + a + "'");
    else if (model.empty()) model = a;
    else return usage_error("unexpected argument '" + a + "'");
  }
  if (until && thru) return usage_error("--until and --thru are mutually exclusive");
  if (resume && workdir.empty()) return usage_error("--resume requires --workdir");
  if (!resume && model.empty()) return usage_error("missing model assertion");

  build::BuildConfig cfg = build::load_build_config(have_config ? config_path : build::config_file_path());
  if (!workdir.empty()) cfg.workdir = workdir;
  if (!output.empty()) cfg.output = output;
  if (!channel.empty()) cfg.channel = channel;
  if (!model.empty()) cfg.model_assertion = model;
  if (debug) cfg.debug = true;

  util::Logger log(util::stderr_sink(), cfg.debug);
  gadgetimg::sys::ProcessRunner runner(log);
  std::signal(SIGINT, on_sigint);

  std::unique_ptr<build::BuildPipeline> pipeline;
  try {
    if (resume)
      pipeline = build::BuildPipeline::resume(cfg, runner, log,
                                              std::filesystem::path(workdir) / build::kCheckpointName);
    else
      pipeline = std::make_unique<build::BuildPipeline>(cfg, runner, log);

    while (!pipeline->closed() && !g_stop.load()) {
      build::Step current = pipeline->next_step();
      if (until && current >= *until) break;
      pipeline->step();
      if (thru && current == *thru) break;
    }
  } catch (const std::exception& e) {
    // BuildError, or filesystem/system errors escaping a step.
    build::Step failed = pipeline ? pipeline->next_step() : build::Step::Init;
    log.error("%s: %s", build::to_string(failed), e.what());
    return 1;
  }

  if (g_stop.load() && !pipeline->closed()) {
    log.warn("interrupted before %s", build::to_string(pipeline->next_step()));
    return 1;
  }
  if (!pipeline->closed())
    log.info("stopped before %s; continue with --resume", build::to_string(pipeline->next_step()));
  return 0;
}

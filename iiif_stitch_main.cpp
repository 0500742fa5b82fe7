#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <atomic>
#include <string>

#include "file_util.h"
#include "stitch_config.h"
#include "stitch_pipeline.h"

// -------------------- Helpers --------------------
static bool parse_int(const char *s, int *out) {
  if (!s || !*s) return false;
  char *end = NULL;
  long v = strtol(s, &end, 10);
  if (end == s || *end != '\0' || v < -1000000 || v > 1000000) return false;
  *out = (int)v;
  return true;
}

// ---------------- Cancellation ----------------
static std::atomic<bool> g_cancel{false};
static void on_signal(int) { g_cancel.store(true); }
static void install_signal_handlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

// ---------------- Main ----------------
static void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s [--config PATH] [--save-config] [-o DIR] [-n NAME]\n"
    "          [-f tiff|png|jpg] [-t auto|N] [-j N] URL\n"
    "\n"
    "  URL            IIIF image service (base URL or .../info.json)\n"
    "  -o, --out DIR  destination directory (default ~/Downloads or .)\n"
    "  -n, --name N   output file name without extension (default downloaded_image)\n"
    "  -f, --format F tiff (lossless), png (lossless, compressed), jpg (lossy)\n"
    "  -t, --tile T   tile size when the server advertises none: auto or 64..4096\n"
    "  -j, --workers  concurrent downloads 1..16 (default 4)\n"
    "  --config PATH  load settings from a JSON file first\n"
    "  --save-config  write the effective settings back to --config PATH\n"
    "\n"
    "Example: %s https://map-view.nls.uk/iiif/2/12807%%2F128076885\n",
    argv0, argv0
  );
}

int main(int argc, char **argv) {
  std::string cfg_path;
  bool save_cfg = false;

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) cfg_path=argv[++i];
  }

  // load config
  stitch_config cfg;
  if (!cfg_path.empty()) {
    std::string txt, err;
    bool missing = false;
    if (read_text_file(cfg_path, txt, &missing, &err)) {
      if (config_from_json_text(txt, cfg)) fprintf(stderr, "[config] loaded %s\n", cfg_path.c_str());
      else { fprintf(stderr, "[config] config parse failed: %s\n", cfg_path.c_str()); return 2; }
    } else if (missing) {
      fprintf(stderr, "[config] no config at %s; using defaults\n", cfg_path.c_str());
    } else {
      fprintf(stderr, "[config] cannot read config: %s\n", err.c_str());
      return 2;
    }
  }

  // CLI overrides
  for (int i=1;i<argc;i++) {
    const char *a = argv[i];
    auto need_value = [&](const char *flag) -> const char* {
      if (i+1 >= argc) { fprintf(stderr, "Missing value for %s\n", flag); return nullptr; }
      return argv[++i];
    };

    if (strcmp(a,"--config")==0) { i++; continue; }
    if (strcmp(a,"--save-config")==0) { save_cfg=true; continue; }
    if (strcmp(a,"-h")==0 || strcmp(a,"--help")==0) { usage(argv[0]); return 0; }

    if (strcmp(a,"-o")==0 || strcmp(a,"--out")==0) {
      const char *v = need_value(a); if (!v) return 2;
      cfg.output_dir = v;
    } else if (strcmp(a,"-n")==0 || strcmp(a,"--name")==0) {
      const char *v = need_value(a); if (!v) return 2;
      cfg.file_name = v;
    } else if (strcmp(a,"-f")==0 || strcmp(a,"--format")==0) {
      const char *v = need_value(a); if (!v) return 2;
      if (!output_kind_from_string(v, cfg.kind)) { fprintf(stderr, "Bad --format '%s'\n", v); return 2; }
    } else if (strcmp(a,"-t")==0 || strcmp(a,"--tile")==0) {
      const char *v = need_value(a); if (!v) return 2;
      if (!tile_size_from_string(v, cfg.tile_size)) { fprintf(stderr, "Bad --tile '%s'\n", v); return 2; }
    } else if (strcmp(a,"-j")==0 || strcmp(a,"--workers")==0) {
      const char *v = need_value(a); if (!v) return 2;
      if (!parse_int(v, &cfg.workers)) { fprintf(stderr, "Bad --workers '%s'\n", v); return 2; }
    } else if (a[0]=='-' && a[1]!='\0') {
      fprintf(stderr, "Unknown arg: %s\n", a);
      usage(argv[0]);
      return 2;
    } else {
      cfg.service_url = a;
    }
  }

  cfg_normalize(cfg);
  if (cfg.service_url.empty()) {
    usage(argv[0]);
    return 2;
  }
  std::string why;
  if (!cfg_validate(cfg, &why)) {
    fprintf(stderr, "Error: %s\n", why.c_str());
    return 2;
  }

  if (save_cfg) {
    if (cfg_path.empty()) { fprintf(stderr, "--save-config needs --config PATH\n"); return 2; }
    std::string err;
    if (write_file_atomic(cfg_path, config_to_json(cfg) + "\n", &err)) fprintf(stderr, "[config] saved %s\n", cfg_path.c_str());
    else fprintf(stderr, "[config] could not save: %s\n", err.c_str());
  }

  install_signal_handlers();

  stitch_events ev;
  ev.on_log = [](const std::string &line) { fprintf(stderr, "%s\n", line.c_str()); };
  std::string last_status;
  ev.on_status = [&last_status](const std::string &s) {
    if (s == last_status) return;
    last_status = s;
    // Per-tile status lines repeat the progress log; keep the terminal quiet.
    if (s.compare(0, 11, "Downloaded ") == 0) return;
    fprintf(stderr, "[status] %s\n", s.c_str());
  };

  run_outcome o = run_stitch(cfg, ev, &g_cancel);

  switch (o.status) {
    case run_status::succeeded:
      printf("%s\n", describe_outcome(o).c_str());
      return 0;
    case run_status::cancelled:
      fprintf(stderr, "%s\n", describe_outcome(o).c_str());
      return 130;
    case run_status::failed:
      fprintf(stderr, "Download Failed\n%s\n", describe_outcome(o).c_str());
      return 1;
  }
  return 1;
}

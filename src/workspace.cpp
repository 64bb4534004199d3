#include "workspace.hpp"
#include <cstdio>
#include <csignal>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include "diagram_file.hpp"
#include "file_io.hpp"

static const char* const kClipboardCommands[] = {
  "wl-copy 2>/dev/null",
  "xclip -selection clipboard 2>/dev/null",
  "xsel --clipboard --input 2>/dev/null",
  "pbcopy 2>/dev/null",
};

std::string base64_encode(const std::string& in) {
  static const char* tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((in.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i + 1]) << 8) |
                 static_cast<unsigned char>(in[i + 2]);
    out += tbl[(v >> 18) & 63]; out += tbl[(v >> 12) & 63]; out += tbl[(v >> 6) & 63]; out += tbl[v & 63];
  }
  size_t rest = in.size() - i;
  if (rest == 1) {
    unsigned v = static_cast<unsigned char>(in[i]) << 16;
    out += tbl[(v >> 18) & 63]; out += tbl[(v >> 12) & 63]; out += "==";
  } else if (rest == 2) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i + 1]) << 8);
    out += tbl[(v >> 18) & 63]; out += tbl[(v >> 12) & 63]; out += tbl[(v >> 6) & 63]; out += '=';
  }
  return out;
}

bool FileWorkspace::save(const Diagram& d, const std::string& ascii, std::string& msg) {
  auto txt = diagram_text_path(save_dir_, d.title);
  auto js = diagram_json_path(save_dir_, d.title);
  if (!write_file_atomic(txt, ascii, msg)) return false;
  if (!save_diagram_file(js, d, msg)) return false;
  spdlog::info("saved {} and {}", txt.string(), js.string());
  msg = "Saved " + txt.string() + " and " + js.string() + "!";
  return true;
}

// A missing tool closes the pipe early; the write must fail with EPIPE
// instead of killing the process.
class ScopedIgnoreSigpipe {
public:
  ScopedIgnoreSigpipe() {
    struct sigaction ign{};
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    ok_ = ::sigaction(SIGPIPE, &ign, &old_) == 0;
  }
  ~ScopedIgnoreSigpipe() { if (ok_) ::sigaction(SIGPIPE, &old_, nullptr); }
  ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
  ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;
private:
  struct sigaction old_{};
  bool ok_ = false;
};

static bool pipe_to(const char* cmd, const std::string& text) {
  ScopedIgnoreSigpipe guard;
  FILE* p = ::popen(cmd, "w");
  if (!p) return false;
  size_t n = std::fwrite(text.data(), 1, text.size(), p);
  bool flushed = std::fflush(p) == 0;
  int rc = ::pclose(p);
  return n == text.size() && flushed && rc == 0;
}

static bool osc52(const std::string& text) {
  UniqueFd tty(::open("/dev/tty", O_WRONLY | O_NOCTTY));
  if (!tty.valid()) return false;
  std::string seq = "\033]52;c;" + base64_encode(text) + "\a";
  const char* p = seq.data();
  size_t remain = seq.size();
  while (remain > 0) {
    ssize_t w = ::write(tty.get(), p, remain);
    if (w < 0) return false;
    p += w;
    remain -= static_cast<size_t>(w);
  }
  return true;
}

bool FileWorkspace::copy_text(const std::string& ascii, std::string& msg) {
  for (const char* cmd : kClipboardCommands) {
    if (pipe_to(cmd, ascii)) {
      spdlog::debug("clipboard via '{}'", cmd);
      msg = "Copied to clipboard!";
      return true;
    }
  }
  if (osc52(ascii)) {
    spdlog::debug("clipboard via OSC 52");
    msg = "Copied to clipboard!";
    return true;
  }
  msg = "clipboard unavailable";
  return false;
}

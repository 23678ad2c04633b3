#include "bumv/editor.hpp"

#include "bumv/consts.hpp"
#include "bumv/fs.hpp"
#include "bumv/util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

constexpr int kExecFailed = 127;

// mkstemps file that is removed when it goes out of scope
class ScopedTempFile {
public:
  ScopedTempFile() {
    std::string tmpl = (stdfs::temp_directory_path() /
                        (std::string(bumv::consts::kListFilePrefix) + "XXXXXX" +
                         std::string(bumv::consts::kListFileSuffix)))
                           .string();
    const int fd = ::mkstemps(tmpl.data(), static_cast<int>(bumv::consts::kListFileSuffix.size()));
    if (fd < 0)
      throw std::runtime_error("cannot create temporary file: " + std::string(std::strerror(errno)));
    ::close(fd);
    path_ = tmpl;
  }
  ~ScopedTempFile() {
    std::error_code ec;
    stdfs::remove(path_, ec);
  }
  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile &operator=(const ScopedTempFile &) = delete;

  [[nodiscard]] const stdfs::path &path() const { return path_; }

private:
  stdfs::path path_;
};

int run_and_wait(const std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0)
    throw std::runtime_error("fork failed: " + std::string(std::strerror(errno)));
  if (pid == 0) {
    ::execvp(argv[0], argv.data());
    ::_exit(kExecFailed);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::runtime_error("waitpid failed: " + std::string(std::strerror(errno)));
  }
  if (WIFSIGNALED(status))
    throw std::runtime_error("editor killed by signal " + std::to_string(WTERMSIG(status)));
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

namespace bumv {

TempFileEditor::TempFileEditor(std::string command) : command_(std::move(command)) {}

std::vector<std::string> TempFileEditor::argv_for(const std::string &file) const {
  auto args = strutil::split_words(command_);
  if (args.empty())
    throw std::runtime_error("no editor configured");
  // VS Code returns immediately unless told to wait for the window to close
  if (stdfs::path(args.front()).filename().string() == consts::kVsCode)
    args.emplace_back(consts::kVsCodeWait);
  args.push_back(file);
  return args;
}

std::string TempFileEditor::edit(std::string_view content) const {
  const ScopedTempFile tmp;
  {
    std::ofstream ofs(tmp.path(), std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("write failed: " + tmp.path().string());
  }

  const auto args = argv_for(tmp.path().string());
  const int rc = run_and_wait(args);
  if (rc == kExecFailed)
    throw std::runtime_error("could not start editor '" + args.front() + "'");
  if (rc != 0)
    throw std::runtime_error("editor exited with status " + std::to_string(rc));

  return fs::read_text(tmp.path());
}

} // namespace bumv

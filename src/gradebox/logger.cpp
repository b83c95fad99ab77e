#include <gradebox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// every color console sink shares this mutex; a child forked while another
// thread holds it would deadlock on its first log line
using console_mutex = spdlog::details::console_mutex;

void LockConsole() { console_mutex::mutex().lock(); }
void UnlockConsole() { console_mutex::mutex().unlock(); }

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(LockConsole, UnlockConsole, UnlockConsole);
}

#ifndef DEMI_CORE_PRECONDITIONS_HPP
#define DEMI_CORE_PRECONDITIONS_HPP

// Precondition failures: caller errors that must not be masked.
//
// A failed precondition calls the installed handler. The default handler
// reports on stderr and aborts. A replacement handler may throw (tests do)
// or terminate; if it returns, the process aborts anyway.

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace demi {

using PreconditionHandler = void (*)(const char *Message, const char *File,
                                     int Line);

namespace detail {

inline void defaultPreconditionHandler(const char *Message, const char *File,
                                       int Line) {
  std::fprintf(stderr, "demi: precondition failed: %s (%s:%d)\n", Message,
               File, Line);
  std::fflush(stderr);
  std::abort();
}

inline std::atomic<PreconditionHandler> &preconditionHandlerSlot() {
  static std::atomic<PreconditionHandler> Slot{&defaultPreconditionHandler};
  return Slot;
}

} // namespace detail

// Install a handler; returns the one it replaces. nullptr restores the
// default.
inline PreconditionHandler setPreconditionHandler(PreconditionHandler H) {
  if (H == nullptr)
    H = &detail::defaultPreconditionHandler;
  return detail::preconditionHandlerSlot().exchange(H);
}

inline PreconditionHandler getPreconditionHandler() {
  return detail::preconditionHandlerSlot().load();
}

[[noreturn]] inline void preconditionFailure(const char *Message,
                                             const char *File, int Line) {
  getPreconditionHandler()(Message, File, Line);
  std::abort();
}

} // namespace demi

#define DEMI_PRECONDITION(Cond, Message)                                       \
  do {                                                                         \
    if (!(Cond))                                                               \
      ::demi::preconditionFailure(Message, __FILE__, __LINE__);                \
  } while (0)

#endif // DEMI_CORE_PRECONDITIONS_HPP

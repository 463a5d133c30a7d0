#ifndef __WT_MESSAGES__
#define __WT_MESSAGES__

#include "Headers.hpp"

namespace wt {
/** @brief Relayed child output. */
struct OutputMessage {
  string data;
};
/** @brief Tells the frontend to wipe its rendered view. */
struct ClearMessage {};
/** @brief Tells the frontend the session restarted and must be re-requested. */
struct ResetMessage {};

typedef std::variant<OutputMessage, ClearMessage, ResetMessage>
    ConsumerMessage;

/** @brief The frontend finished loading and reports its geometry. */
struct TerminalReady {
  int cols;
  int rows;
  string cwd;
};
struct TerminalInput {
  string data;
};
struct TerminalResize {
  int cols;
  int rows;
};
struct ClearRequest {};
struct ResetRequest {};
/** @brief An error the frontend wants recorded in the daemon log. */
struct FrontendError {
  string message;
};

typedef std::variant<TerminalReady, TerminalInput, TerminalResize,
                     ClearRequest, ResetRequest, FrontendError>
    FrontendMessage;

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/** @brief Wire name of a consumer message ("output", "clear", "reset"). */
inline string consumerMessageType(const ConsumerMessage &message) {
  return std::visit(
      overloaded{[](const OutputMessage &) { return string("output"); },
                 [](const ClearMessage &) { return string("clear"); },
                 [](const ResetMessage &) { return string("reset"); }},
      message);
}
}  // namespace wt

#endif  // __WT_MESSAGES__

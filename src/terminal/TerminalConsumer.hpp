#ifndef __WT_TERMINAL_CONSUMER__
#define __WT_TERMINAL_CONSUMER__

#include "Headers.hpp"
#include "Messages.hpp"

namespace wt {
/**
 * @brief The single live view attached to a session.
 *
 * `send` throws when the channel behind the view is gone; the session buffer
 * treats that as a disconnect.
 */
class TerminalConsumer {
 public:
  virtual ~TerminalConsumer() {}

  virtual void send(const ConsumerMessage &message) = 0;

  /** @brief Identifier used in logs. */
  virtual string getId() const = 0;
};
}  // namespace wt

#endif  // __WT_TERMINAL_CONSUMER__

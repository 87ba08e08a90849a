#include "menu.hpp"
#include "config.hpp"
#include "log.hpp"

ReadResult read_and(Session& rl, const LineHandler& fn) {
  return read_and_mut(rl, [&fn](Session&, const std::string& line, Response& resp, std::string& err) {
    return fn(line, resp, err);
  });
}

ReadResult read_and_mut(Session& rl, const SessionHandler& fn) {
  for (;;) {
    ReadResult r = rl.read();
    if (r.status == ReadStatus::Interrupted) break;
    if (r.status == ReadStatus::EndOfTransmission) rl.deny();
    else if (!r.ok()) return r;

    std::error_code ec;
    if (!rl.clear_below(ec)) return ReadResult::io_failure(ec);
    Response resp = Response::Accept;
    std::string err;
    if (!fn(rl, r.text, resp, err)) {
      ML_LOG("line rejected: %s", err.c_str());
      if (!rl.print_inline(ML_INDENT + err, ec)) return ReadResult::io_failure(ec);
      continue;
    }
    switch (resp) {
      case Response::Accept: rl.accept(); break;
      case Response::Deny: rl.deny(); break;
      case Response::Break: return ReadResult();
      case Response::Continue: break;
    }
  }
  return ReadResult();
}

#include "sink.hpp"
#include <exception>

namespace chatpace {

DispatchResult dispatch_once(Sink& sink, const std::string& chat_id,
                             const MessageChunk& chunk) {
    try {
        return sink.send_chunk(chat_id, chunk);
    } catch (const DispatchError& e) {
        return e.transient() ? DispatchResult::transient(e.what())
                             : DispatchResult::permanent(e.what());
    } catch (const std::exception& e) {
        return DispatchResult::transient(e.what());
    }
}

} // namespace chatpace

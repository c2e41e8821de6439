#ifndef NBRANK_EVENT_SINK_HPP
#define NBRANK_EVENT_SINK_HPP

#include <cstddef>
#include <string>

namespace nbrank {

/**
 * @brief Receives the informational conditions met while reranking.
 *
 * Line numbers start at 1, 0 meaning that the caller did not provide one.
 * The base class ignores every event.
 */
class RerankEventSink {
public:
    virtual ~RerankEventSink() {}

    // The record had less than two hypotheses and was left untouched.
    virtual void no_op(std::size_t line, std::size_t num_hypotheses) {}
    // The blank best hypothesis was replaced by the reference.
    virtual void replaced_by_reference(std::size_t line) {}
    // The blank best hypothesis was replaced by hypothesis index.
    virtual void replaced_by_non_blank(std::size_t line, std::size_t index,
                                       const std::string & hypothesis) {}
};

}  // namespace nbrank

#endif  // NBRANK_EVENT_SINK_HPP

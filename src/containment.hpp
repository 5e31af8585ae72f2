#pragma once

#include <optional>

namespace pyhamt {

/**
 * ContainmentHook - capability of a sequence to answer membership queries
 * without scanning itself.
 *
 * Sequences opt in by deriving from this interface. fastContains() returns
 * std::nullopt when it cannot answer cheaply for the given element.
 */
template <typename Element>
class ContainmentHook {
public:
    virtual ~ContainmentHook() = default;
    virtual std::optional<bool> fastContains(const Element& element) const = 0;
};

/**
 * FastContainsView - presents a set-like standard container (anything with
 * key_type, begin/end and find) as a sequence with a containment hook.
 * The container must outlive the view.
 */
template <typename Container>
class FastContainsView : public ContainmentHook<typename Container::key_type> {
private:
    const Container& container_;

public:
    using value_type = typename Container::value_type;
    using const_iterator = typename Container::const_iterator;

    explicit FastContainsView(const Container& container) : container_(container) {}

    const_iterator begin() const { return container_.begin(); }
    const_iterator end() const { return container_.end(); }

    std::optional<bool> fastContains(const typename Container::key_type& element) const override {
        return container_.find(element) != container_.end();
    }
};

}  // namespace pyhamt

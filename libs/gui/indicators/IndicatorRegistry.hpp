#pragma once
#include "IndicatorDescriptor.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tdchart {

/**
 * Catalog of indicator descriptors keyed by name.
 * Append-only: registering a name that already exists is a silent no-op, so
 * start-up code may register the same indicators any number of times.
 */
class IndicatorRegistry {
public:
    IndicatorRegistry() = default;
    IndicatorRegistry(const IndicatorRegistry&) = delete;
    IndicatorRegistry& operator=(const IndicatorRegistry&) = delete;

    /**
     * Get the process-wide instance.
     */
    static IndicatorRegistry& instance();

    /**
     * Check-then-insert under the registry lock.
     * @return true if the descriptor was added, false if the name was taken or the descriptor incomplete
     */
    bool registerIndicator(IndicatorDescriptor descriptor);

    bool contains(const std::string& name) const;

    /**
     * Returns nullptr when no indicator has that name.
     */
    std::shared_ptr<const IndicatorDescriptor> find(const std::string& name) const;

    // Sorted by name.
    std::vector<std::string> supportedIndicators() const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const IndicatorDescriptor>> m_descriptors;
};

} // namespace tdchart

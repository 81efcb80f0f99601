#include "IndicatorRegistry.hpp"
#include "../TdChartLogging.hpp"

namespace tdchart {

IndicatorRegistry& IndicatorRegistry::instance() {
    static IndicatorRegistry instance;
    return instance;
}

bool IndicatorRegistry::registerIndicator(IndicatorDescriptor descriptor) {
    if (!descriptor.isComplete()) {
        tLog_Warning("IndicatorRegistry: Rejected incomplete descriptor" << QString::fromStdString(descriptor.name));
        return false;
    }

    const std::string name = descriptor.name;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_descriptors.find(name) != m_descriptors.end()) {
            tLog_Debug("IndicatorRegistry: Indicator" << QString::fromStdString(name) << "already registered");
            return false;
        }
        m_descriptors.emplace(name, std::make_shared<const IndicatorDescriptor>(std::move(descriptor)));
    }

    tLog_App("IndicatorRegistry: Registered indicator" << QString::fromStdString(name));
    return true;
}

bool IndicatorRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_descriptors.find(name) != m_descriptors.end();
}

std::shared_ptr<const IndicatorDescriptor> IndicatorRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_descriptors.find(name);
    if (it == m_descriptors.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> IndicatorRegistry::supportedIndicators() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_descriptors.size());
    for (const auto& pair : m_descriptors) {
        names.push_back(pair.first);
    }
    return names;
}

size_t IndicatorRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_descriptors.size();
}

void IndicatorRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_descriptors.clear();
}

} // namespace tdchart

#pragma once

#include "ConstraintProfile.hpp"
#include "FeedbackData.hpp"
#include "Logger.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace coach {

/**
 * Name -> definition lookup, filled once at startup and read every tick.
 *
 * Registering the same instance twice is a no-op. A second instance under
 * an existing name is rejected (first registration wins).
 *
 * @tparam T definition type
 * @tparam NameField member holding the lookup key
 */
template<typename T, std::string T::*NameField>
class NamedRegistry {
public:
    explicit NamedRegistry(const std::string& kind) : log_(kind + "Registry") {}

    /**
     * @return true if the entry is (now) registered under its name
     */
    bool add(std::shared_ptr<const T> entry) {
        if (!entry) return false;

        const std::string& name = (*entry).*NameField;
        if (name.empty()) {
            log_.warn("ignoring entry without a name");
            return false;
        }

        auto it = entries_.find(name);
        if (it != entries_.end()) {
            if (it->second == entry) return true;  // same instance, idempotent
            log_.warn("'", name, "' already registered, keeping the first definition");
            return false;
        }

        entries_.emplace(name, std::move(entry));
        log_.debug("registered '", name, "'");
        return true;
    }

    bool add(T entry) {
        return add(std::make_shared<const T>(std::move(entry)));
    }

    /**
     * @return the entry or nullptr. A miss is not an error.
     */
    [[nodiscard]] const T* find(const std::string& name) const {
        auto it = entries_.find(name);
        return it != entries_.end() ? it->second.get() : nullptr;
    }

    [[nodiscard]] bool contains(const std::string& name) const { return entries_.count(name) > 0; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            out.push_back(name);
        }
        return out;
    }

private:
    LogChannel log_;
    std::map<std::string, std::shared_ptr<const T>> entries_;
};

class ProfileRegistry : public NamedRegistry<ConstraintProfile, &ConstraintProfile::signName> {
public:
    ProfileRegistry() : NamedRegistry("Profile") {}

    bool registerProfile(std::shared_ptr<const ConstraintProfile> profile) { return add(std::move(profile)); }
    bool registerProfile(ConstraintProfile profile) {
        profile.normalize();
        return add(std::move(profile));
    }
};

class DynamicGestureRegistry : public NamedRegistry<DynamicGestureDefinition, &DynamicGestureDefinition::gestureName> {
public:
    DynamicGestureRegistry() : NamedRegistry("DynamicGesture") {}

    bool registerDefinition(std::shared_ptr<const DynamicGestureDefinition> def) { return add(std::move(def)); }
    bool registerDefinition(DynamicGestureDefinition def) { return add(std::move(def)); }
};

} // namespace coach

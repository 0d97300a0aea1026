#include "hook_registry.hpp"

#include <agentlink/errors.hpp>
#include <stdexcept>

namespace agentlink
{
namespace internal
{

json HookRegistry::register_hooks(const std::map<std::string, std::vector<HookMatcher>>& hooks)
{
    if (sealed_)
        throw std::logic_error("Hook callbacks cannot be registered after initialization");

    json config = json::object();

    for (const auto& [event, matchers] : hooks)
    {
        json matcher_list = json::array();
        for (const auto& matcher : matchers)
        {
            json callback_ids = json::array();
            for (const auto& callback : matcher.hooks)
            {
                std::string callback_id = "hook_" + std::to_string(next_callback_id_++);
                callbacks_[callback_id] = callback;
                callback_ids.push_back(callback_id);
            }

            json entry = {{"matcher", matcher.matcher ? json(*matcher.matcher) : json(nullptr)},
                          {"hookCallbackIds", callback_ids}};
            if (matcher.timeout && *matcher.timeout > 0)
                entry["timeout"] = *matcher.timeout;

            matcher_list.push_back(entry);
        }

        if (!matcher_list.empty())
            config[event] = matcher_list;
    }

    return config;
}

const HookCallback* HookRegistry::find(const std::string& callback_id) const
{
    auto it = callbacks_.find(callback_id);
    if (it == callbacks_.end())
        return nullptr;
    return &it->second;
}

json HookRegistry::invoke(const std::string& callback_id, const json& input,
                          const std::string& tool_use_id, const HookContext& context) const
{
    const HookCallback* callback = find(callback_id);
    if (!callback)
        throw DispatchError("No hook callback found for ID: " + callback_id);

    HookInput typed = parse_hook_input(input);
    HookOutput output = (*callback)(typed, tool_use_id, context);
    return output.to_json();
}

} // namespace internal
} // namespace agentlink

#ifndef AGENTLINK_INTERNAL_HOOK_REGISTRY_HPP
#define AGENTLINK_INTERNAL_HOOK_REGISTRY_HPP

#include <agentlink/hooks.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace agentlink
{
namespace internal
{

/**
 * Callback ids assigned at handshake time.
 *
 * register_hooks() hands out "hook_N" ids and builds the "hooks" section of
 * the initialize request. After seal() the registry is read-only, so lookups
 * from concurrent dispatch workers need no locking.
 */
class HookRegistry
{
  public:
    // Assign ids to every callback and return the handshake payload:
    // {event: [{matcher, hookCallbackIds, timeout?}, ...]}
    // Throws std::logic_error once sealed.
    json register_hooks(const std::map<std::string, std::vector<HookMatcher>>& hooks);

    void seal()
    {
        sealed_ = true;
    }

    bool sealed() const
    {
        return sealed_;
    }

    // nullptr if the id is unknown
    const HookCallback* find(const std::string& callback_id) const;

    // Parse the raw input, run the callback and return its wire output.
    // Throws DispatchError for unknown ids or events; callback exceptions propagate.
    json invoke(const std::string& callback_id, const json& input, const std::string& tool_use_id,
                const HookContext& context) const;

    std::size_t size() const
    {
        return callbacks_.size();
    }

  private:
    std::map<std::string, HookCallback> callbacks_;
    std::size_t next_callback_id_ = 0;
    bool sealed_ = false;
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_HOOK_REGISTRY_HPP

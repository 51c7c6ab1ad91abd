// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "loader.hpp"
#include "reload.hpp"
#include "result.hpp"
#include "types.hpp"

namespace vigil {

struct SensorAttachment {
    AttachmentHandle handle = kInvalidAttachment;
    std::string name; // "kprobe:<call>" or "tracepoint:<subsystem>/<event>"
    ProgramKind kind = ProgramKind::Kprobe;
};

std::string kprobe_attachment_name(const std::string& call);
std::string tracepoint_attachment_name(const std::string& subsystem, const std::string& event);

/**
 * The attached programs of one tracing policy.
 *
 * load() compiles every selector list before attaching anything, so a policy
 * with a bad selector never reaches the kernel. Selector reloads go through
 * the coordinator and never change the set of attached programs.
 */
class Sensor {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

  public:
    Sensor(PrivateTag, std::string policy_name, AttachmentLoader& loader, ReloadCoordinator& coordinator)
        : policy_name_(std::move(policy_name)), loader_(loader), coordinator_(coordinator)
    {
    }
    ~Sensor();

    Sensor(const Sensor&) = delete;
    Sensor& operator=(const Sensor&) = delete;

    static Result<std::unique_ptr<Sensor>> load(const TracingPolicy& policy, AttachmentLoader& loader,
                                                 ReloadCoordinator& coordinator);

    // The two-list forms keep the argument declarations of the previous load;
    // the others compile against `args` and keep them on success.
    Result<void> reload_kprobe_selectors(const std::string& call, const std::vector<SelectorSpec>& selectors);
    Result<void> reload_kprobe_selectors(const std::string& call, const std::vector<SelectorSpec>& selectors,
                                         const std::vector<ArgumentSpec>& args);
    Result<void> reload_tracepoint_selectors(const std::string& subsystem, const std::string& event,
                                             const std::vector<SelectorSpec>& selectors);
    Result<void> reload_tracepoint_selectors(const std::string& subsystem, const std::string& event,
                                             const std::vector<SelectorSpec>& selectors,
                                             const std::vector<ArgumentSpec>& args);

    // Applies the selectors and argument declarations of `policy` to the
    // attachments it names. Every attachment is resolved and compiled before
    // the first publish, so a policy with a bad selector or a probe this
    // sensor never attached changes nothing. Attaching takes a new load().
    Result<void> reload_policy(const TracingPolicy& policy);

    // Detaches every program and frees its tables. Safe to call twice.
    Result<void> unload();

    [[nodiscard]] const std::string& policy_name() const { return policy_name_; }
    [[nodiscard]] const std::vector<SensorAttachment>& attachments() const { return attachments_; }
    [[nodiscard]] std::optional<AttachmentHandle> find_attachment(const std::string& name) const;

  private:
    Result<void> attach_one(const ProgramDescriptor& program, std::string name, const std::vector<ArgumentSpec>& args,
                            const std::vector<SelectorSpec>& selectors);

    std::string policy_name_;
    AttachmentLoader& loader_;
    ReloadCoordinator& coordinator_;
    std::vector<SensorAttachment> attachments_;
};

} // namespace vigil

// cppcheck-suppress-file missingIncludeSystem
#include "sensor.hpp"

#include <utility>

#include "config.hpp"
#include "logging.hpp"
#include "selectors.hpp"
#include "tracing.hpp"

namespace vigil {

std::string kprobe_attachment_name(const std::string& call)
{
    return "kprobe:" + call;
}

std::string tracepoint_attachment_name(const std::string& subsystem, const std::string& event)
{
    return "tracepoint:" + subsystem + "/" + event;
}

Sensor::~Sensor()
{
    auto result = unload();
    if (!result) {
        logger().log(SLOG_WARN("Sensor teardown incomplete")
                         .field("policy", policy_name_)
                         .field("error", result.error().to_string()));
    }
}

Result<std::unique_ptr<Sensor>> Sensor::load(const TracingPolicy& policy, AttachmentLoader& loader,
                                             ReloadCoordinator& coordinator)
{
    const std::string trace_id = make_span_id("trace-sensor");
    ScopedSpan span("sensor.load", trace_id);

    if (policy.version != 1) {
        span.fail("unsupported policy version");
        return Error(ErrorCode::InvalidArgument, "Unsupported policy version", std::to_string(policy.version));
    }

    // Compile everything up front; nothing is attached for a broken policy.
    std::vector<KprobeOptions> kprobe_options;
    for (const auto& kp : policy.kprobes) {
        const std::string name = kprobe_attachment_name(kp.call);
        auto options = parse_kprobe_options(kp.options);
        if (!options) {
            span.fail(options.error().to_string());
            return options.error().with_context(name);
        }
        kprobe_options.push_back(*options);

        auto compiled = compile_selectors(kp.selectors, kp.args, coordinator.identity(), coordinator.config());
        if (!compiled) {
            span.fail(compiled.error().to_string());
            return compiled.error().with_context(name);
        }
    }
    for (const auto& tp : policy.tracepoints) {
        auto compiled = compile_selectors(tp.selectors, tp.args, coordinator.identity(), coordinator.config());
        if (!compiled) {
            span.fail(compiled.error().to_string());
            return compiled.error().with_context(tracepoint_attachment_name(tp.subsystem, tp.event));
        }
    }

    auto sensor = std::make_unique<Sensor>(PrivateTag{}, policy.name, loader, coordinator);

    for (size_t i = 0; i < policy.kprobes.size(); ++i) {
        const KprobeSpec& kp = policy.kprobes[i];
        ProgramDescriptor program;
        program.kind = ProgramKind::Kprobe;
        program.target = kp.call;
        program.syscall = kp.syscall;
        program.return_probe = kp.return_probe;
        program.return_arg = kp.return_arg;
        program.disable_kprobe_multi = kprobe_options[i].disable_kprobe_multi;

        auto attached = sensor->attach_one(program, kprobe_attachment_name(kp.call), kp.args, kp.selectors);
        if (!attached) {
            span.fail(attached.error().to_string());
            return attached.error();
        }
    }
    for (const auto& tp : policy.tracepoints) {
        ProgramDescriptor program;
        program.kind = ProgramKind::Tracepoint;
        program.category = tp.subsystem;
        program.target = tp.event;

        auto attached =
            sensor->attach_one(program, tracepoint_attachment_name(tp.subsystem, tp.event), tp.args, tp.selectors);
        if (!attached) {
            span.fail(attached.error().to_string());
            return attached.error();
        }
    }

    logger().log(SLOG_INFO("Sensor loaded")
                     .field("policy", policy.name)
                     .field("kprobes", static_cast<uint64_t>(policy.kprobes.size()))
                     .field("tracepoints", static_cast<uint64_t>(policy.tracepoints.size()))
                     .field("programs", static_cast<uint64_t>(loader.attached_program_count())));
    return sensor;
}

Result<void> Sensor::attach_one(const ProgramDescriptor& program, std::string name,
                                const std::vector<ArgumentSpec>& args, const std::vector<SelectorSpec>& selectors)
{
    auto handle = loader_.attach(program);
    if (!handle) {
        return handle.error().with_context(name);
    }

    auto registered = coordinator_.register_attachment(*handle, name, args);
    if (!registered) {
        auto detached = loader_.detach(*handle);
        if (!detached) {
            logger().log(SLOG_WARN("Failed to detach program")
                             .field("attachment", name)
                             .field("error", detached.error().to_string()));
        }
        return registered.error().with_context(name);
    }
    attachments_.push_back(SensorAttachment{*handle, name, program.kind});

    // A failure here leaves the attachment recorded; the caller drops the
    // sensor and the destructor tears it down.
    TRY(coordinator_.reload(*handle, selectors));
    return {};
}

std::optional<AttachmentHandle> Sensor::find_attachment(const std::string& name) const
{
    for (const auto& att : attachments_) {
        if (att.name == name) {
            return att.handle;
        }
    }
    return std::nullopt;
}

Result<void> Sensor::reload_kprobe_selectors(const std::string& call, const std::vector<SelectorSpec>& selectors)
{
    const std::string name = kprobe_attachment_name(call);
    auto handle = find_attachment(name);
    if (!handle) {
        return Error::not_found(name);
    }
    return coordinator_.reload(*handle, selectors);
}

Result<void> Sensor::reload_kprobe_selectors(const std::string& call, const std::vector<SelectorSpec>& selectors,
                                             const std::vector<ArgumentSpec>& args)
{
    const std::string name = kprobe_attachment_name(call);
    auto handle = find_attachment(name);
    if (!handle) {
        return Error::not_found(name);
    }
    return coordinator_.reload(*handle, selectors, args);
}

Result<void> Sensor::reload_tracepoint_selectors(const std::string& subsystem, const std::string& event,
                                                 const std::vector<SelectorSpec>& selectors)
{
    const std::string name = tracepoint_attachment_name(subsystem, event);
    auto handle = find_attachment(name);
    if (!handle) {
        return Error::not_found(name);
    }
    return coordinator_.reload(*handle, selectors);
}

Result<void> Sensor::reload_tracepoint_selectors(const std::string& subsystem, const std::string& event,
                                                 const std::vector<SelectorSpec>& selectors,
                                                 const std::vector<ArgumentSpec>& args)
{
    const std::string name = tracepoint_attachment_name(subsystem, event);
    auto handle = find_attachment(name);
    if (!handle) {
        return Error::not_found(name);
    }
    return coordinator_.reload(*handle, selectors, args);
}

Result<void> Sensor::reload_policy(const TracingPolicy& policy)
{
    const std::string trace_id = make_span_id("trace-sensor-reload");
    ScopedSpan span("sensor.reload_policy", trace_id);

    if (policy.version != 1) {
        span.fail("unsupported policy version");
        return Error(ErrorCode::InvalidArgument, "Unsupported policy version", std::to_string(policy.version));
    }

    struct PendingReload {
        AttachmentHandle handle;
        const std::vector<SelectorSpec>* selectors;
        const std::vector<ArgumentSpec>* args;
    };
    std::vector<PendingReload> pending;
    auto prepare = [&](const std::string& name, const std::vector<SelectorSpec>& selectors,
                       const std::vector<ArgumentSpec>& args) -> Result<void> {
        auto handle = find_attachment(name);
        if (!handle) {
            return Error::not_found(name);
        }
        auto compiled = compile_selectors(selectors, args, coordinator_.identity(), coordinator_.config());
        if (!compiled) {
            return compiled.error().with_context(name);
        }
        pending.push_back(PendingReload{*handle, &selectors, &args});
        return {};
    };

    for (const auto& kp : policy.kprobes) {
        auto prepared = prepare(kprobe_attachment_name(kp.call), kp.selectors, kp.args);
        if (!prepared) {
            span.fail(prepared.error().to_string());
            return prepared.error();
        }
    }
    for (const auto& tp : policy.tracepoints) {
        auto prepared = prepare(tracepoint_attachment_name(tp.subsystem, tp.event), tp.selectors, tp.args);
        if (!prepared) {
            span.fail(prepared.error().to_string());
            return prepared.error();
        }
    }

    // Only loader failures can stop a publish from here on.
    std::optional<Error> first_error;
    for (const auto& p : pending) {
        auto result = coordinator_.reload(p.handle, *p.selectors, *p.args);
        if (!result && !first_error) {
            first_error = result.error();
        }
    }
    if (first_error) {
        span.fail(first_error->to_string());
        return *first_error;
    }
    return {};
}

Result<void> Sensor::unload()
{
    std::optional<Error> first_error;
    for (const auto& att : attachments_) {
        auto unregistered = coordinator_.unregister_attachment(att.handle);
        if (!unregistered && !first_error) {
            first_error = unregistered.error().with_context(att.name);
        }
        auto detached = loader_.detach(att.handle);
        if (!detached && !first_error) {
            first_error = detached.error().with_context(att.name);
        }
    }
    if (!attachments_.empty()) {
        logger().log(SLOG_INFO("Sensor unloaded")
                         .field("policy", policy_name_)
                         .field("attachments", static_cast<uint64_t>(attachments_.size())));
    }
    attachments_.clear();
    if (first_error) {
        return *first_error;
    }
    return {};
}

} // namespace vigil

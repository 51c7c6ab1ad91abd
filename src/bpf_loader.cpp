// cppcheck-suppress-file missingIncludeSystem
#include "bpf_loader.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include "logging.hpp"
#include "utils.hpp"

namespace vigil {

namespace {

int libbpf_print(enum libbpf_print_level level, const char* format, va_list args)
{
    char buf[1024];
    int n = std::vsnprintf(buf, sizeof(buf), format, args);
    if (n <= 0) {
        return n;
    }
    std::string message = trim(buf);
    if (message.empty()) {
        return n;
    }
    switch (level) {
        case LIBBPF_WARN:
            logger().log(SLOG_WARN("libbpf").field("detail", message));
            break;
        case LIBBPF_INFO:
            logger().log(SLOG_INFO("libbpf").field("detail", message));
            break;
        default:
            logger().log(SLOG_DEBUG("libbpf").field("detail", message));
            break;
    }
    return n;
}

Error map_error(int err, const std::string& what)
{
    Error sys = Error::system(err, what);
    return Error(ErrorCode::BpfMapOperationFailed, what, sys.context());
}

const char* program_name(const ProgramDescriptor& program)
{
    if (program.kind == ProgramKind::Tracepoint) {
        return kTracepointProgram;
    }
    return program.return_probe ? kKretprobeProgram : kKprobeProgram;
}

std::string describe(const ProgramDescriptor& program)
{
    if (program.kind == ProgramKind::Tracepoint) {
        return program.category + "/" + program.target;
    }
    return program.target;
}

} // namespace

MapFd::~MapFd()
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

MapFd& MapFd::operator=(MapFd&& o) noexcept
{
    if (this != &o) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

void BpfState::cleanup()
{
    for (auto* link : links) {
        bpf_link__destroy(link);
    }
    links.clear();
    config_blob = MapFd();
    if (obj) {
        bpf_object__close(obj);
        obj = nullptr;
    }
    sel_config = nullptr;
    int_tables = nullptr;
    str_tables = nullptr;
}

void install_libbpf_logger()
{
    libbpf_set_print(libbpf_print);
}

Result<void> bump_memlock_rlimit()
{
    rlimit rlim{};
    rlim.rlim_cur = RLIM_INFINITY;
    rlim.rlim_max = RLIM_INFINITY;
    if (setrlimit(RLIMIT_MEMLOCK, &rlim) != 0) {
        return Error::system(errno, "setrlimit(RLIMIT_MEMLOCK) failed");
    }
    return {};
}

std::string resolve_bpf_obj_path(const std::string& configured)
{
    std::error_code ec;
    if (!configured.empty() && std::filesystem::exists(configured, ec)) {
        return configured;
    }
    const std::string local = "vigil.bpf.o";
    if (std::filesystem::exists(local, ec)) {
        return local;
    }
    return configured.empty() ? std::string(kBpfObjInstallPath) : configured;
}

BpfLoader::BpfLoader(std::string obj_path) : obj_path_(resolve_bpf_obj_path(obj_path)) {}

BpfLoader::~BpfLoader()
{
    std::lock_guard<std::mutex> lock(mu_);
    tables_.clear();
    attachments_.clear();
}

uint64_t attach_cookie(const ProgramDescriptor& program)
{
    uint64_t cookie = 0;
    if (program.return_probe && program.return_arg) {
        cookie |= static_cast<uint64_t>(*program.return_arg) & kCookieReturnTypeMask;
    }
    if (program.syscall) {
        cookie |= kCookieSyscall;
    }
    return cookie;
}

Result<void> BpfLoader::load_and_attach(const ProgramDescriptor& program, bool kprobe_multi, BpfState& state)
{
    state.obj = bpf_object__open_file(obj_path_.c_str(), nullptr);
    if (!state.obj) {
        return Error(ErrorCode::BpfLoadFailed, "Failed to open BPF object", obj_path_ + ": " + std::strerror(errno));
    }

    // Only the program this attachment needs is verified.
    const char* wanted = program_name(program);
    bpf_program* target = nullptr;
    bpf_program* prog = nullptr;
    bpf_object__for_each_program(prog, state.obj)
    {
        const bool is_wanted = std::strcmp(bpf_program__name(prog), wanted) == 0;
        int err = bpf_program__set_autoload(prog, is_wanted);
        if (err) {
            return Error(ErrorCode::BpfLoadFailed, "Failed to configure program autoload", std::strerror(-err));
        }
        if (is_wanted) {
            target = prog;
        }
    }
    if (!target) {
        return Error(ErrorCode::BpfLoadFailed, "BPF program not found", wanted);
    }
    if (kprobe_multi) {
        int err = bpf_program__set_expected_attach_type(target, BPF_TRACE_KPROBE_MULTI);
        if (err) {
            return Error(ErrorCode::BpfLoadFailed, "Failed to set kprobe_multi attach type", std::strerror(-err));
        }
    }

    int err = bpf_object__load(state.obj);
    if (err) {
        return Error(ErrorCode::BpfLoadFailed, "Failed to load BPF object", std::strerror(-err));
    }

    state.sel_config = bpf_object__find_map_by_name(state.obj, kSelConfigMap);
    state.int_tables = bpf_object__find_map_by_name(state.obj, kSelIntTablesMap);
    state.str_tables = bpf_object__find_map_by_name(state.obj, kSelStrTablesMap);
    if (!state.sel_config || !state.int_tables || !state.str_tables) {
        return Error(ErrorCode::BpfLoadFailed, "BPF object is missing selector maps", obj_path_);
    }

    bpf_link* link = nullptr;
    if (program.kind == ProgramKind::Tracepoint) {
        link = bpf_program__attach_tracepoint(target, program.category.c_str(), program.target.c_str());
    } else if (kprobe_multi) {
        const char* syms[] = {program.target.c_str()};
        __u64 cookies[] = {attach_cookie(program)};
        bpf_kprobe_multi_opts opts{};
        opts.sz = sizeof(opts);
        opts.syms = syms;
        opts.cookies = cookies;
        opts.cnt = 1;
        opts.retprobe = program.return_probe;
        link = bpf_program__attach_kprobe_multi_opts(target, nullptr, &opts);
    } else {
        bpf_kprobe_opts opts{};
        opts.sz = sizeof(opts);
        opts.bpf_cookie = attach_cookie(program);
        opts.retprobe = program.return_probe;
        link = bpf_program__attach_kprobe_opts(target, program.target.c_str(), &opts);
    }
    if (!link) {
        return Error(ErrorCode::BpfAttachFailed, "Failed to attach program",
                     describe(program) + ": " + std::strerror(errno));
    }
    state.links.push_back(link);
    return {};
}

Result<AttachmentHandle> BpfLoader::attach(const ProgramDescriptor& program)
{
    bool kprobe_multi = program.kind == ProgramKind::Kprobe && !program.disable_kprobe_multi;
    auto state = std::make_unique<BpfState>();
    auto attached = load_and_attach(program, kprobe_multi, *state);

    // Kernels before 5.18 reject kprobe_multi at load or attach time. An
    // object that failed to open is not retried.
    if (!attached && kprobe_multi && state->is_loaded()) {
        logger().log(SLOG_WARN("kprobe_multi unavailable, using a single kprobe")
                         .field("target", describe(program))
                         .field("error", attached.error().to_string()));
        kprobe_multi = false;
        state = std::make_unique<BpfState>();
        attached = load_and_attach(program, kprobe_multi, *state);
    }
    if (!attached) {
        return attached.error();
    }

    std::lock_guard<std::mutex> lock(mu_);
    const AttachmentHandle handle = next_attachment_++;
    attachments_.emplace(handle, std::move(state));
    logger().log(SLOG_INFO("Program attached")
                     .field("handle", static_cast<uint32_t>(handle))
                     .field("target", describe(program))
                     .field("program", program_name(program))
                     .field("kprobe_multi", kprobe_multi)
                     .field("cookie", attach_cookie(program)));
    return handle;
}

Result<void> BpfLoader::update_config(AttachmentHandle handle, const CompiledSelectorBlob& blob)
{
    if (blob.size() > kMaxBlobBytes) {
        return Error(ErrorCode::InvalidArgument, "Blob exceeds config value size", std::to_string(blob.size()));
    }

    std::lock_guard<std::mutex> lock(mu_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) {
        return Error::not_found("attachment " + std::to_string(handle));
    }
    BpfState& state = *it->second;

    const uint32_t zero = 0;
    MapFd inner(bpf_map_create(BPF_MAP_TYPE_ARRAY, "vigil_sel_blob", sizeof(uint32_t), kMaxBlobBytes, 1, nullptr));
    if (!inner) {
        return map_error(errno, "Failed to create selector blob map");
    }
    std::vector<uint8_t> value(kMaxBlobBytes, 0);
    std::memcpy(value.data(), blob.data(), blob.size());
    if (bpf_map_update_elem(inner.fd(), &zero, value.data(), BPF_ANY)) {
        return map_error(errno, "Failed to write selector blob");
    }

    const int inner_fd = inner.fd();
    if (bpf_map_update_elem(bpf_map__fd(state.sel_config), &zero, &inner_fd, BPF_ANY)) {
        return map_error(errno, "Failed to swap selector blob");
    }
    state.config_blob = std::move(inner);
    return {};
}

Result<TableHandle> BpfLoader::alloc_table(AttachmentHandle handle, const TableRequest& request)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) {
        return Error::not_found("attachment " + std::to_string(handle));
    }
    BpfState& state = *it->second;
    bpf_map* outer = request.kind == TableKeyKind::String ? state.str_tables : state.int_tables;

    const uint32_t entries = request.size_hint == 0 ? 1 : request.size_hint;
    MapFd inner(bpf_map_create(BPF_MAP_TYPE_HASH, "vigil_sel_set", request.key_size, sizeof(uint8_t), entries, nullptr));
    if (!inner) {
        return Error(ErrorCode::TableAllocationFailed, "Failed to create table map", std::strerror(errno));
    }
    const int inner_fd = inner.fd();
    if (bpf_map_update_elem(bpf_map__fd(outer), &request.id, &inner_fd, BPF_NOEXIST)) {
        return Error(ErrorCode::TableAllocationFailed, "Failed to register table", std::strerror(errno));
    }

    Table table;
    table.attachment = handle;
    table.id = request.id;
    table.kind = request.kind;
    table.key_size = request.key_size;
    table.map = std::move(inner);

    const TableHandle table_handle = next_table_++;
    tables_.emplace(table_handle, std::move(table));
    return table_handle;
}

Result<void> BpfLoader::write_table(TableHandle table, const std::vector<std::vector<uint8_t>>& keys)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Error::not_found("table " + std::to_string(table));
    }
    const uint8_t present = 1;
    for (const auto& key : keys) {
        if (key.size() != it->second.key_size) {
            return Error(ErrorCode::InvalidArgument, "Table key size mismatch", std::to_string(key.size()));
        }
        if (bpf_map_update_elem(it->second.map.fd(), key.data(), &present, BPF_ANY)) {
            return map_error(errno, "Failed to write table entry");
        }
    }
    return {};
}

Result<void> BpfLoader::free_table(TableHandle table)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Error::not_found("table " + std::to_string(table));
    }
    auto att = attachments_.find(it->second.attachment);
    if (att != attachments_.end()) {
        bpf_map* outer = it->second.kind == TableKeyKind::String ? att->second->str_tables : att->second->int_tables;
        if (bpf_map_delete_elem(bpf_map__fd(outer), &it->second.id) && errno != ENOENT) {
            return map_error(errno, "Failed to unregister table");
        }
    }
    tables_.erase(it);
    return {};
}

Result<void> BpfLoader::detach(AttachmentHandle handle)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = attachments_.find(handle);
    if (it == attachments_.end()) {
        return Error::not_found("attachment " + std::to_string(handle));
    }
    for (auto t = tables_.begin(); t != tables_.end();) {
        if (t->second.attachment == handle) {
            t = tables_.erase(t);
        } else {
            ++t;
        }
    }
    attachments_.erase(it);
    return {};
}

size_t BpfLoader::attached_program_count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& [handle, state] : attachments_) {
        n += state->links.size();
    }
    return n;
}

} // namespace vigil

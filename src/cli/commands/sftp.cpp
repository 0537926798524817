#include "../terminal.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static void emit_failure(const Dispatcher::Emit& emit, ErrorKind kind, const std::string& msg) {
    emit(OutputEvent::error(kind, msg));
}

static void do_sftp_start(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    auto r = term.session().sftp().start();
    if (r.is_err()) return emit_failure(emit, r.kind, r.error);
    emit(OutputEvent::out(r.value));
}

static void do_sftp_ls(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    std::string path = cmd.args.empty() ? "." : cmd.args[0];
    auto r = term.session().sftp().list(path);
    if (r.is_err()) return emit_failure(emit, r.kind, "sftp-ls: " + r.error);
    emit(OutputEvent::out(FileTransfer::format_listing(r.value)));
}

static void do_sftp_get(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.args.size() < 2) {
        return emit_failure(emit, ErrorKind::PRECONDITION,
            "sftp-get: missing arguments\nUsage: sftp-get <remote_path> <local_path>");
    }
    const std::string& remote = cmd.args[0];
    auto local = term.config().resolve_local(cmd.args[1]);

    auto r = term.session().sftp().download(remote, local);
    if (r.is_err()) return emit_failure(emit, r.kind, "sftp-get: " + r.error);
    emit(OutputEvent::out(fmt::format("Downloaded {} -> {} ({})", remote, local.string(),
                                      format_size(r.value))));
}

static void do_sftp_put(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.args.size() < 2) {
        return emit_failure(emit, ErrorKind::PRECONDITION,
            "sftp-put: missing arguments\nUsage: sftp-put <local_path> <remote_path>");
    }
    auto local = term.config().resolve_local(cmd.args[0]);
    const std::string& remote = cmd.args[1];

    auto r = term.session().sftp().upload(local, remote);
    if (r.is_err()) return emit_failure(emit, r.kind, "sftp-put: " + r.error);
    emit(OutputEvent::out(fmt::format("Uploaded {} -> {} ({})", local.string(), remote,
                                      format_size(r.value))));
}

static void do_sftp_mkdir(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.args.empty()) {
        return emit_failure(emit, ErrorKind::PRECONDITION,
                            "sftp-mkdir: missing path\nUsage: sftp-mkdir <path>");
    }
    auto r = term.session().sftp().mkdir(cmd.args[0]);
    if (r.is_err()) return emit_failure(emit, r.kind, "sftp-mkdir: " + r.error);
    emit(OutputEvent::out("Created directory " + cmd.args[0]));
}

static void do_sftp_rm(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.args.empty()) {
        return emit_failure(emit, ErrorKind::PRECONDITION,
                            "sftp-rm: missing path\nUsage: sftp-rm <path>");
    }
    auto r = term.session().sftp().remove(cmd.args[0]);
    if (r.is_err()) return emit_failure(emit, r.kind, "sftp-rm: " + r.error);
    emit(OutputEvent::out("Removed " + cmd.args[0]));
}

void register_sftp_commands(Terminal& term) {
    auto& d = term.dispatcher();
    auto bind = [&term](void (*fn)(Terminal&, const CommandLine&, const Dispatcher::Emit&)) {
        return [&term, fn](const CommandLine& c, const Dispatcher::Emit& e) { fn(term, c, e); };
    };
    d.add_async_command("sftp-start", bind(do_sftp_start), "Open the SFTP sub-session", "Files");
    d.add_async_command("sftp-ls", bind(do_sftp_ls), "List a remote directory: sftp-ls [path]", "Files");
    d.add_async_command("sftp-get", bind(do_sftp_get), "Download: sftp-get <remote> <local>", "Files");
    d.add_async_command("sftp-put", bind(do_sftp_put), "Upload: sftp-put <local> <remote>", "Files");
    d.add_async_command("sftp-mkdir", bind(do_sftp_mkdir), "Create a remote directory", "Files");
    d.add_async_command("sftp-rm", bind(do_sftp_rm), "Remove a remote file or empty directory", "Files");
}

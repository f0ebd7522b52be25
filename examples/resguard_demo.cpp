// Walks a few managed resources through their whole lifecycle and narrates
// each step on stdout.

#include <cstdio>
#include <memory>
#include <string>

#include "resguard/resguard.hpp"

using namespace resguard;

namespace {

void section(const char* title) {
    printf("\n%s\n", title);
    printf("--------------------------------------------------\n");
}

std::string join_path(const std::string& dir, const char* name) {
    if (dir.empty() || dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

void print_file(const FileSnapshot& snap) {
    printf("\nfile #%llu\n", static_cast<unsigned long long>(snap.instance_id));
    printf("   path:    %s\n", snap.path.c_str());
    printf("   mode:    %s\n", to_string(snap.mode));
    printf("   created: %s\n", format_datetime(snap.created_at).c_str());
    printf("   state:   %s\n", snap.open ? "open" : "closed");
    printf("   lines:   %zu\n", snap.lines_written);
}

void print_connection(const ConnectionSnapshot& snap) {
    printf("\nconnection #%llu\n", static_cast<unsigned long long>(snap.instance_id));
    printf("   address: %s\n", snap.endpoint.address().c_str());
    printf("   user:    %s\n", snap.endpoint.user.c_str());
    printf("   state:   %s\n", snap.connected ? "connected" : "disconnected");
    printf("   queries: %zu\n", snap.queries_executed);
}

void report(const char* what, const Status& status) {
    if (status.is_err()) {
        printf("   %s: %s\n", what, status.error().describe().c_str());
    }
}

template<typename T>
void report(const char* what, const Outcome<T>& outcome) {
    if (outcome.is_err()) {
        printf("   %s: %s\n", what, outcome.error().describe().c_str());
    }
}

// A file that lives only inside this function
void temporary_file(ResourceManager& manager, const std::string& dir) {
    printf("\nentering temporary_file()\n");
    auto on_exit = make_scope_exit([&manager]() {
        printf("left temporary_file(), live files: %zu\n", manager.live(ResourceKind::File));
    });

    FileResource temp = manager.open_file(join_path(dir, "archivo_temporal.txt"), FileMode::Write);
    report("write", temp.write_line("This file is released automatically"));
    report("write", temp.write_line("when it goes out of scope"));
    print_file(temp.describe());
    printf("leaving temporary_file()\n");
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_demo_args(argc, argv);
    if (parsed.is_err()) {
        fprintf(stderr, "resguard_demo: %s\n%s", parsed.error().c_str(), demo_usage());
        return 2;
    }
    DemoConfig config = parsed.unwrap();
    if (config.show_help) {
        printf("%s", demo_usage());
        return 0;
    }

    ConsoleSink console(stdout, config.quiet);
    SystemClock clock;
    ResourceManager manager(console, clock);

    printf("==================================================\n");
    printf("resource lifecycle demonstration\n");
    printf("==================================================\n");

    section("1. acquiring resources");
    FileResource data = manager.open_file(join_path(config.directory, "datos_ejemplo.txt"),
                                          FileMode::Write);
    FileResource append_log = manager.open_file(join_path(config.directory, "log_sistema.txt"),
                                                FileMode::Append);
    ConnectionResource db = manager.connect(
        config.database,
        std::make_unique<SimulatedConnector>(config.connect_delay, config.query_delay));
    report("open", data.status());
    report("open", append_log.status());
    report("connect", db.status());

    section("2. using them");
    report("write", data.write_line("First line of data"));
    report("write", data.write_line("Second line of data"));
    report("write", data.write_line("Data processed successfully"));

    report("write", append_log.write_line("System started"));
    report("write", append_log.write_line("User connected"));
    report("write", append_log.write_line("Processing requests"));

    report("query", db.execute("SELECT * FROM usuarios"));
    report("query", db.execute("SELECT * FROM productos WHERE activo = 1"));
    report("query", db.execute("UPDATE estadisticas SET visitas = visitas + 1"));

    section("3. describing them");
    print_file(data.describe());
    print_file(append_log.describe());
    print_connection(db.describe());

    section("4. release at end of scope");
    temporary_file(manager, config.directory);

    section("5. current state");
    printf("live files: %zu, live connections: %zu\n", manager.live(ResourceKind::File),
           manager.live(ResourceKind::Connection));

    section("6. explicit release");
    report("release", data.release());
    report("release", db.release());
    report("release again", data.release());
    report("write after release", data.write_line("never written"));
    printf("live files: %zu, live connections: %zu\n", manager.live(ResourceKind::File),
           manager.live(ResourceKind::Connection));

    section("7. shutting down");
    printf("'%s' is released when main() returns\n", append_log.path().c_str());
    printf("\n==================================================\n");
    printf("end of demonstration\n");
    printf("==================================================\n");
    return 0;
}

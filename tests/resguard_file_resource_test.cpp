// Tests for resguard::FileResource
#include "resguard/file_resource.hpp"
#include "test_support.hpp"
#include <cassert>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

using namespace resguard;
using namespace resguard_test;

void test_file_write_then_read_back() {
    printf("test_file_write_then_read_back: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        NullSink sink;
        SystemClock clock;
        std::string path = dir.file("data.txt");

        FileResource writer(registry, path, FileMode::Write, sink, clock);
        assert(writer.status().is_ok());
        assert(writer.is_open());
        assert(writer.write_line("A").is_ok());
        assert(writer.write_line("B").is_ok());
        assert(writer.release().is_ok());

        FileResource reader(registry, path, FileMode::Read, sink, clock);
        assert(reader.status().is_ok());
        auto contents = reader.read_all();
        assert(contents.is_ok());

        std::vector<std::string> lines = split_lines(contents.value());
        assert(lines.size() == 4);
        assert(starts_with(lines[0], "=== File created at "));
        assert(ends_with(lines[1], " - A"));
        assert(ends_with(lines[2], " - B"));
        assert(starts_with(lines[3], "=== File closed at "));
    }
    printf("PASS\n");
}

void test_file_line_prefix_uses_clock() {
    printf("test_file_line_prefix_uses_clock: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        NullSink sink;
        ManualClock clock(std::chrono::system_clock::now());
        std::string path = dir.file("stamped.txt");

        FileResource writer(registry, path, FileMode::Write, sink, clock);
        std::string expected = format_time_of_day(clock.now()) + " - hello";
        assert(writer.write_line("hello").is_ok());
        assert(writer.written_lines().size() == 2);
        assert(writer.written_lines()[0] == header_marker(clock.now()));
        assert(writer.written_lines()[1] == expected);
        assert(writer.release().is_ok());

        std::vector<std::string> lines = split_lines(slurp(path));
        assert(lines.size() == 3);
        assert(lines[1] == expected);
        assert(lines[2] == closing_marker(clock.now()));
    }
    printf("PASS\n");
}

void test_file_write_in_read_mode_is_rejected() {
    printf("test_file_write_in_read_mode_is_rejected: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;
        std::string path = dir.file("existing.txt");
        {
            std::FILE* f = std::fopen(path.c_str(), "w");
            assert(f != nullptr);
            std::fputs("original\n", f);
            std::fclose(f);
        }

        FileResource reader(registry, path, FileMode::Read, sink, clock);
        assert(reader.is_open());
        Status written = reader.write_line("intruder");
        assert(written.is_err());
        assert(written.error().kind == ErrorKind::InvalidOperation);
        assert(sink.count(EventType::OperationRejected) == 1);
        assert(reader.written_lines().empty());
        assert(reader.release().is_ok());

        // read mode never adds markers either
        assert(slurp(path) == "original\n");
    }
    printf("PASS\n");
}

void test_file_read_in_write_mode_is_rejected() {
    printf("test_file_read_in_write_mode_is_rejected: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        NullSink sink;
        SystemClock clock;

        FileResource writer(registry, dir.file("w.txt"), FileMode::Write, sink, clock);
        auto contents = writer.read_all();
        assert(contents.is_err());
        assert(contents.error().kind == ErrorKind::InvalidOperation);
    }
    printf("PASS\n");
}

void test_file_invalid_target() {
    printf("test_file_invalid_target: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;
        std::string path = dir.file("missing-dir/nested.txt");

        FileResource broken(registry, path, FileMode::Write, sink, clock);
        assert(broken.status().is_err());
        assert(broken.status().error().kind == ErrorKind::AcquisitionFailure);
        assert(!broken.is_open());
        assert(sink.count(EventType::AcquisitionFailed) == 1);
        assert(sink.count(EventType::Created) == 0);

        // still constructed, so still counted
        assert(registry.live(ResourceKind::File) == 1);

        Status w1 = broken.write_line("lost");
        Status w2 = broken.write_line("also lost");
        assert(w1.is_err() && w1.error().kind == ErrorKind::InvalidOperation);
        assert(w2.is_err() && w2.error().kind == ErrorKind::InvalidOperation);
        assert(broken.read_all().is_err());
        assert(broken.describe().lines_written == 0);
        assert(!broken.describe().open);

        assert(broken.release().is_ok());
        assert(registry.live(ResourceKind::File) == 0);
        assert(!std::filesystem::exists(path));
    }
    printf("PASS\n");
}

void test_file_read_missing_file() {
    printf("test_file_read_missing_file: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        NullSink sink;
        SystemClock clock;

        FileResource reader(registry, dir.file("nope.txt"), FileMode::Read, sink, clock);
        assert(reader.status().is_err());
        assert(reader.status().error().kind == ErrorKind::AcquisitionFailure);
        auto contents = reader.read_all();
        assert(contents.is_err());
        assert(contents.error().kind == ErrorKind::InvalidOperation);
    }
    printf("PASS\n");
}

void test_file_release_is_idempotent() {
    printf("test_file_release_is_idempotent: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;
        std::string path = dir.file("twice.txt");

        FileResource writer(registry, path, FileMode::Write, sink, clock);
        assert(writer.write_line("only line").is_ok());
        assert(writer.release().is_ok());
        assert(writer.release().is_ok());
        assert(writer.release().is_ok());
        assert(writer.is_released());
        assert(!writer.is_open());

        assert(sink.count(EventType::Released) == 1);
        assert(registry.live(ResourceKind::File) == 0);
        assert(registry.released(ResourceKind::File) == 1);

        std::vector<std::string> lines = split_lines(slurp(path));
        int closing = 0;
        for (const std::string& line : lines) {
            if (starts_with(line, "=== File closed at ")) {
                ++closing;
            }
        }
        assert(closing == 1);
    }
    printf("PASS\n");
}

void test_file_operations_after_release() {
    printf("test_file_operations_after_release: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;
        std::string path = dir.file("after.txt");

        FileResource writer(registry, path, FileMode::Write, sink, clock);
        assert(writer.write_line("kept").is_ok());
        assert(writer.release().is_ok());
        std::string before = slurp(path);

        Status late = writer.write_line("too late");
        assert(late.is_err());
        assert(late.error().kind == ErrorKind::InvalidOperation);
        assert(writer.read_all().is_err());
        assert(slurp(path) == before);
        assert(writer.describe().lines_written == 2);
        assert(sink.count(EventType::OperationRejected) == 2);
    }
    printf("PASS\n");
}

void test_file_destructor_releases() {
    printf("test_file_destructor_releases: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;
        std::string path = dir.file("scoped.txt");

        {
            FileResource temp(registry, path, FileMode::Write, sink, clock);
            assert(temp.write_line("inside").is_ok());
            assert(registry.live(ResourceKind::File) == 1);
        }
        assert(registry.live(ResourceKind::File) == 0);
        assert(sink.count(EventType::Released) == 1);

        std::vector<std::string> lines = split_lines(slurp(path));
        assert(lines.size() == 3);
        assert(starts_with(lines[2], "=== File closed at "));

        // an explicit release before scope end means the destructor does nothing
        {
            FileResource temp(registry, path, FileMode::Append, sink, clock);
            assert(temp.release().is_ok());
        }
        assert(sink.count(EventType::Released) == 2);
    }
    printf("PASS\n");
}

void test_file_append_keeps_existing_content() {
    printf("test_file_append_keeps_existing_content: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        NullSink sink;
        SystemClock clock;
        std::string path = dir.file("log.txt");

        {
            FileResource first(registry, path, FileMode::Append, sink, clock);
            assert(first.write_line("System started").is_ok());
        }
        {
            FileResource second(registry, path, FileMode::Append, sink, clock);
            assert(second.write_line("User connected").is_ok());
        }

        std::vector<std::string> lines = split_lines(slurp(path));
        assert(lines.size() == 6);
        assert(starts_with(lines[0], "=== File created at "));
        assert(ends_with(lines[1], " - System started"));
        assert(starts_with(lines[2], "=== File closed at "));
        assert(starts_with(lines[3], "=== File created at "));
        assert(ends_with(lines[4], " - User connected"));
        assert(starts_with(lines[5], "=== File closed at "));
    }
    printf("PASS\n");
}

void test_file_describe() {
    printf("test_file_describe: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        NullSink sink;
        ManualClock clock(std::chrono::system_clock::now());
        std::string path = dir.file("info.txt");

        FileResource writer(registry, path, FileMode::Write, sink, clock);
        assert(writer.write_line("one").is_ok());
        assert(writer.write_line("two").is_ok());

        FileSnapshot snap = writer.describe();
        assert(snap.instance_id == 1);
        assert(snap.path == path);
        assert(snap.mode == FileMode::Write);
        assert(snap.created_at == clock.now());
        assert(snap.open);
        assert(snap.lines_written == 3);  // header included

        assert(writer.release().is_ok());
        snap = writer.describe();
        assert(!snap.open);
        assert(snap.lines_written == 3);
    }
    printf("PASS\n");
}

void test_file_move() {
    printf("test_file_move: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;
        std::string path = dir.file("moved.txt");

        FileResource a(registry, path, FileMode::Write, sink, clock);
        FileResource b = std::move(a);
        assert(!a.is_open());
        assert(a.is_released());
        assert(b.is_open());
        assert(registry.live(ResourceKind::File) == 1);

        // the moved-from shell rejects work and releases nothing
        assert(a.write_line("ghost").is_err());
        assert(a.release().is_ok());
        assert(registry.live(ResourceKind::File) == 1);

        assert(b.write_line("real").is_ok());

        FileResource c(registry, dir.file("other.txt"), FileMode::Write, sink, clock);
        assert(registry.live(ResourceKind::File) == 2);
        c = std::move(b);  // c's own file is closed first
        assert(registry.live(ResourceKind::File) == 1);
        assert(sink.count(EventType::Released) == 1);
        assert(c.path() == path);
        assert(c.release().is_ok());
        assert(registry.live(ResourceKind::File) == 0);

        std::vector<std::string> lines = split_lines(slurp(path));
        assert(lines.size() == 3);
        assert(ends_with(lines[1], " - real"));
    }
    printf("PASS\n");
}

void test_file_events() {
    printf("test_file_events: ");
    {
        TempDir dir;
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;

        {
            FileResource writer(registry, dir.file("events.txt"), FileMode::Write, sink, clock);
            assert(writer.write_line("x").is_ok());
        }

        const std::vector<LifecycleEvent>& events = sink.events();
        assert(events.size() == 3);
        assert(events[0].type == EventType::Created);
        assert(events[0].kind == ResourceKind::File);
        assert(events[0].live_count == 1);
        assert(events[1].type == EventType::Operation);
        assert(events[1].detail == "wrote: x");
        assert(events[2].type == EventType::Released);
        assert(events[2].detail == "2 lines written");
        assert(events[2].live_count == 0);
    }
    printf("PASS\n");
}

void test_file_release_failure_still_closes() {
    printf("test_file_release_failure_still_closes: ");
    {
        InstanceRegistry registry;
        RecordingSink sink;
        SystemClock clock;

        // /dev/full accepts the buffered writes but fails the flush on close
        FileResource full(registry, "/dev/full", FileMode::Write, sink, clock);
        assert(full.status().is_ok());
        assert(full.write_line("x").is_ok());
        assert(registry.live(ResourceKind::File) == 1);

        Status released = full.release();
        assert(released.is_err());
        assert(released.error().kind == ErrorKind::ReleaseFailure);
        assert(!full.is_open());
        assert(full.is_released());
        assert(registry.live(ResourceKind::File) == 0);
        assert(sink.count(EventType::ReleaseFailed) == 1);
        assert(sink.count(EventType::Released) == 0);

        assert(full.release().is_ok());
        assert(sink.count(EventType::ReleaseFailed) == 1);
        assert(registry.released(ResourceKind::File) == 1);
    }
    printf("PASS\n");
}

int main() {
    printf("=== Testing resguard::FileResource ===\n");

    test_file_write_then_read_back();
    test_file_line_prefix_uses_clock();
    test_file_write_in_read_mode_is_rejected();
    test_file_read_in_write_mode_is_rejected();
    test_file_invalid_target();
    test_file_read_missing_file();
    test_file_release_is_idempotent();
    test_file_release_failure_still_closes();
    test_file_operations_after_release();
    test_file_destructor_releases();
    test_file_append_keeps_existing_content();
    test_file_describe();
    test_file_move();
    test_file_events();

    printf("\nAll FileResource tests passed!\n");
    return 0;
}

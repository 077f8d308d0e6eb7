// Memory backend and reconnecting proxy tests
// MemoryStore stands in for a remote server: fail_after() and
// disconnect_all() sever sessions at chosen points

#include "nodefs/nodefs.hpp"
#include "test_helpers.hpp"
#include <memory>
#include <thread>

using namespace nodefs;

static std::string pattern_text(size_t size) {
    std::string text(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        text[i] = static_cast<char>('a' + i % 23);
    }
    return text;
}

static std::shared_ptr<ReconnectingFileSystem> wrap_store(const std::shared_ptr<MemoryStore>& store) {
    return ReconnectingFileSystem::wrap([store] { return store->connect(); });
}

// Session that may keep part of an interrupted write
class PersistingMemoryFileSystem : public MemoryFileSystem {
public:
    using MemoryFileSystem::MemoryFileSystem;
    InFlightWrites in_flight_writes() const override { return InFlightWrites::MayPersist; }
};

// ============================================================================
// Memory Backend Tests
// ============================================================================

void test_memory_basics() {
    std::cout << "  test_memory_basics..." << std::endl;

    auto store = MemoryStore::create("basics");
    auto filesystem = store->connect();
    ASSERT_EQ(filesystem->name(), "memory:basics");

    NodePtr root = filesystem->root();
    ASSERT_TRUE(root->require<Readable>().is_folder());
    ASSERT_FS_ERROR(root->require<Writable>().delete_just_this_thing(), ErrorCode::PermissionDenied);

    NodePtr file = filesystem->resolve("/docs/readme.txt");
    ASSERT_FS_ERROR(file->require<Writable>().write("x"), ErrorCode::NotFound);
    file->require<Hierarchy>().parent()->require<Writable>().mkdirs();
    file->require<Writable>().write("read me");
    ASSERT_EQ(file->require<Readable>().read_string(), "read me");
    ASSERT_EQ(file->require<Sizable>().size(), 7u);
    ASSERT_EQ(root->require<Sizable>().size(), 7u);

    NodePtr docs = filesystem->resolve("/docs");
    ASSERT_FS_ERROR(docs->require<Writable>().delete_just_this_thing(), ErrorCode::IOFailure);
    docs->require<Writable>().remove();
    ASSERT_FALSE(file->require<Readable>().exists());
}

void test_memory_links() {
    std::cout << "  test_memory_links..." << std::endl;

    auto filesystem = MemoryStore::create("links")->connect();
    NodePtr target = filesystem->resolve("/target.txt");
    target->require<Writable>().write("pointed at");

    NodePtr link = filesystem->resolve("/alias");
    link->require<Writable>().link_to("target.txt");
    ASSERT_TRUE(link->require<Readable>().is_link());
    ASSERT_TRUE(link->require<Readable>().is_file());
    ASSERT_EQ(link->require<Readable>().read_string(), "pointed at");
    ASSERT_TRUE(*link->require<Readable>().dereference(true) == *target);

    NodePtr loop = filesystem->resolve("/loop");
    loop->require<Writable>().link_to("loop");
    ASSERT_TRUE(loop->require<Readable>().is_broken());
    ASSERT_FS_ERROR(loop->require<Readable>().dereference(true), ErrorCode::BrokenLink);
}

void test_memory_xattrs() {
    std::cout << "  test_memory_xattrs..." << std::endl;

    auto filesystem = MemoryStore::create("xattrs")->connect();
    NodePtr source = filesystem->resolve("/source");
    NodePtr copy = filesystem->resolve("/copy");
    source->require<Writable>().write("s");
    copy->require<Writable>().write("c");

    ExtendedAttributes& attributes = source->require<ExtendedAttributes>();
    attributes.set_xattr("user.kind", "raw");
    attributes.set_xattr("user.owner", "lab");
    copy->require<ExtendedAttributes>().set_xattr("user.stale", "1");

    attributes.copy_xattrs_to(copy->require<ExtendedAttributes>());
    auto names = copy->require<ExtendedAttributes>().list_xattrs();
    ASSERT_EQ(names.size(), 2u);
    ASSERT_EQ(names[0], "user.kind");
    ASSERT_EQ(copy->require<ExtendedAttributes>().get_xattr("user.owner"), "lab");
    ASSERT_FS_ERROR(copy->require<ExtendedAttributes>().get_xattr("user.stale"), ErrorCode::NotFound);

    // copy_to carries attributes on request
    NodePtr third = filesystem->resolve("/third");
    CopyOptions options;
    options.copy_xattrs = true;
    source->require<Readable>().copy_to(*third, options);
    ASSERT_EQ(third->require<ExtendedAttributes>().get_xattr("user.kind"), "raw");
}

void test_memory_permissions() {
    std::cout << "  test_memory_permissions..." << std::endl;

    auto store = MemoryStore::create("permissions");
    auto filesystem = store->connect();
    NodePtr file = filesystem->resolve("/locked.txt");
    file->require<Writable>().write("secret");

    store->set_permissions(Path::parse("/locked.txt"), false, false);
    ASSERT_FS_ERROR(file->require<Readable>().read(), ErrorCode::PermissionDenied);
    ASSERT_FS_ERROR(file->require<Writable>().append("more"), ErrorCode::PermissionDenied);
    ASSERT_FS_ERROR(file->require<Writable>().remove(), ErrorCode::PermissionDenied);
}

void test_memory_remove_stops_at_first_failure() {
    std::cout << "  test_memory_remove_stops_at_first_failure..." << std::endl;

    auto store = MemoryStore::create("fail_fast");
    auto filesystem = store->connect();
    NodePtr folder = filesystem->resolve("/d");
    folder->require<Writable>().create_folder();
    filesystem->resolve("/d/a_file")->require<Writable>().write("a");
    NodePtr sub = filesystem->resolve("/d/sub");
    sub->require<Writable>().create_folder();

    // "a_file" is listed before "sub", so nothing after it is touched
    store->set_permissions(Path::parse("/d/a_file"), true, false);
    ASSERT_FS_ERROR(folder->require<Writable>().remove(), ErrorCode::PermissionDenied);
    ASSERT_TRUE(sub->require<Readable>().exists());
    ASSERT_TRUE(folder->require<Readable>().exists());
    ASSERT_EQ(filesystem->resolve("/d/a_file")->require<Readable>().read_string(), "a");
}

void test_memory_working_directory() {
    std::cout << "  test_memory_working_directory..." << std::endl;

    auto store = MemoryStore::create("cwd");
    auto filesystem = store->connect();
    NodePtr folder = filesystem->resolve("/work");
    folder->require<Writable>().create_folder();
    filesystem->resolve("/work/job.txt")->require<Writable>().write("job");

    {
        WorkingScope scope = folder->require<WorkingDirectory>().as_working();
        ASSERT_EQ(filesystem->resolve("job.txt")->require<Readable>().read_string(), "job");
    }
    ASSERT_EQ(filesystem->root()->require<WorkingDirectory>().current_working()->path().str(), "/");

    // Sessions keep separate working folders
    folder->require<WorkingDirectory>().cd();
    auto other = store->connect();
    ASSERT_EQ(other->resolve("job.txt")->path().str(), "/job.txt");
}

void test_memory_rename_across_filesystems() {
    std::cout << "  test_memory_rename_across_filesystems..." << std::endl;

    auto left = MemoryStore::create("left")->connect();
    auto right = MemoryStore::create("right")->connect();
    NodePtr from = left->resolve("/moving.txt");
    from->require<Writable>().write("payload");
    NodePtr to = right->resolve("/arrived.txt");

    from->require<Writable>().rename_to(*to);
    ASSERT_FALSE(from->require<Readable>().exists());
    ASSERT_EQ(to->require<Readable>().read_string(), "payload");
}

void test_memory_disconnect() {
    std::cout << "  test_memory_disconnect..." << std::endl;

    auto store = MemoryStore::create("disconnect");
    auto filesystem = store->connect();
    NodePtr file = filesystem->resolve("/f");
    file->require<Writable>().write("f");

    store->disconnect_all();
    ASSERT_FS_ERROR(file->require<Readable>().exists(), ErrorCode::Disconnected);
    ASSERT_EQ(store->connect()->resolve("/f")->require<Readable>().read_string(), "f");

    auto fresh = store->connect();
    store->fail_after(2);
    fresh->root()->require<Readable>().exists();
    fresh->root()->require<Readable>().exists();
    ASSERT_FS_ERROR(fresh->root()->require<Readable>().exists(), ErrorCode::Disconnected);
}

void run_memory_tests() {
    std::cout << "=== Memory Backend Tests ===" << std::endl;
    test_memory_basics();
    test_memory_links();
    test_memory_xattrs();
    test_memory_permissions();
    test_memory_remove_stops_at_first_failure();
    test_memory_working_directory();
    test_memory_rename_across_filesystems();
    test_memory_disconnect();
    std::cout << "  Memory Backend tests completed" << std::endl << std::endl;
}

// ============================================================================
// Reconnecting Proxy Tests
// ============================================================================

void test_proxy_mirrors_capabilities() {
    std::cout << "  test_proxy_mirrors_capabilities..." << std::endl;

    auto store = MemoryStore::create("mirror");
    auto direct = store->connect();
    auto proxy = wrap_store(store);
    ASSERT_EQ(proxy->name(), "memory:mirror");

    NodePtr proxied = proxy->resolve("/a.txt");
    NodePtr plain = direct->resolve("/a.txt");
    ASSERT_TRUE(proxied->capabilities() == plain->capabilities());
    ASSERT_TRUE(std::dynamic_pointer_cast<ProxyNode>(proxied) != nullptr);
    ASSERT_TRUE(*proxied == *plain);

    URLConfig config;
    config.base = "https://example.org";
    auto url_proxy = ReconnectingFileSystem::wrap([config] {
        return std::make_shared<URLFileSystem>(config);
    });
    NodePtr page = url_proxy->resolve("https://example.org/docs/page.html");
    ASSERT_EQ(page->capabilities().to_string(), "Hierarchy,Readable,Sizable");
    ASSERT_TRUE(page->as<Writable>() == nullptr);
    ASSERT_TRUE(page->as<Listable>() == nullptr);
    ASSERT_FS_ERROR(page->require<Writable>(), ErrorCode::UnsupportedOperation);
    ASSERT_EQ(page->path().str(), "https://example.org/docs/page.html");
}

void test_proxy_wraps_returned_nodes() {
    std::cout << "  test_proxy_wraps_returned_nodes..." << std::endl;

    auto store = MemoryStore::create("wrapping");
    auto proxy = wrap_store(store);
    proxy->resolve("/dir")->require<Writable>().create_folder();
    proxy->resolve("/dir/one")->require<Writable>().write("1");
    proxy->resolve("/dir/two")->require<Writable>().write("22");

    NodePtr dir = proxy->resolve("/dir");
    size_t count = 0;
    for (const auto& child : dir->require<Listable>().children()) {
        ASSERT_TRUE(std::dynamic_pointer_cast<ProxyNode>(child) != nullptr);
        ASSERT_TRUE(child->filesystem() == proxy);
        ++count;
    }
    ASSERT_EQ(count, 2u);
    ASSERT_TRUE(std::dynamic_pointer_cast<ProxyNode>(dir->require<Hierarchy>().parent()) != nullptr);
    ASSERT_EQ(dir->require<Sizable>().size(), 3u);
    ASSERT_EQ(dir->require<Listable>().glob("t*").to_vector().size(), 1u);

    auto mounts = proxy->mountpoints();
    ASSERT_EQ(mounts.size(), 1u);
    ASSERT_TRUE(mounts[0]->filesystem() == proxy);
    ASSERT_FALSE(mounts[0]->usage().has_value());
    ASSERT_TRUE(proxy->root()->require<Hierarchy>().is_mount());
}

void test_proxy_read_survives_disconnect() {
    std::cout << "  test_proxy_read_survives_disconnect..." << std::endl;

    auto store = MemoryStore::create("read");
    std::string text = pattern_text(40000);
    store->connect()->resolve("/data.bin")->require<Writable>().write(text);

    auto proxy = wrap_store(store);
    NodePtr node = proxy->resolve("/data.bin");
    auto blocks = node->require<Readable>().read_blocks(16384);

    // The first chunk arrives, the second read finds the session severed
    store->fail_after(1);
    std::string received;
    for (const auto& block : blocks) {
        received.append(reinterpret_cast<const char*>(block.data()), block.size());
    }

    ASSERT_EQ(received.size(), text.size());
    ASSERT_TRUE(received == text);
    ASSERT_EQ(proxy->reconnect_count(), 1u);
    ASSERT_EQ(proxy->generation(), 1u);
    ASSERT_TRUE(proxy->state() == ReconnectingFileSystem::State::Connected);
    ASSERT_EQ(store->session_count(), 3u);

    // Nodes from before the rebuild keep working
    ASSERT_EQ(node->require<Sizable>().size(), 40000u);
}

void test_proxy_hash_survives_disconnect() {
    std::cout << "  test_proxy_hash_survives_disconnect..." << std::endl;

    auto store = MemoryStore::create("hash");
    std::string text = pattern_text(50000);
    auto direct = store->connect();
    NodePtr plain = direct->resolve("/blob");
    plain->require<Writable>().write(text);
    std::string expected = plain->require<Readable>().hash("sha256");

    auto proxy = wrap_store(store);
    NodePtr node = proxy->resolve("/blob");
    store->fail_after(3);
    ASSERT_EQ(node->require<Readable>().hash("sha256"), expected);
    ASSERT_EQ(proxy->reconnect_count(), 1u);
}

void test_proxy_working_folder_survives_disconnect() {
    std::cout << "  test_proxy_working_folder_survives_disconnect..." << std::endl;

    auto store = MemoryStore::create("proxy_cwd");
    auto direct = store->connect();
    direct->resolve("/work")->require<Writable>().create_folder();
    direct->resolve("/work/job.txt")->require<Writable>().write("work job");
    direct->resolve("/job.txt")->require<Writable>().write("root job");

    auto proxy = wrap_store(store);
    NodePtr work = proxy->resolve("/work");
    work->require<WorkingDirectory>().cd();
    ASSERT_EQ(proxy->resolve("job.txt")->path().str(), "/work/job.txt");

    store->disconnect_all();
    NodePtr current = proxy->root()->require<WorkingDirectory>().current_working();
    ASSERT_EQ(proxy->reconnect_count(), 1u);
    ASSERT_TRUE(*current == *work);
    ASSERT_EQ(proxy->resolve("job.txt")->require<Readable>().read_string(), "work job");

    // A scope spanning the rebuild restores the folder it started from
    NodePtr root = proxy->root();
    {
        WorkingScope scope = root->require<WorkingDirectory>().as_working();
        store->disconnect_all();
        ASSERT_EQ(proxy->resolve("job.txt")->require<Readable>().read_string(), "root job");
        ASSERT_EQ(proxy->reconnect_count(), 2u);
    }
    store->disconnect_all();
    ASSERT_EQ(proxy->resolve("job.txt")->require<Readable>().read_string(), "work job");
    ASSERT_EQ(proxy->reconnect_count(), 3u);
}

void test_proxy_permission_not_retried() {
    std::cout << "  test_proxy_permission_not_retried..." << std::endl;

    auto store = MemoryStore::create("denied");
    store->connect()->resolve("/secret")->require<Writable>().write("s");
    store->set_permissions(Path::parse("/secret"), false, true);

    auto proxy = wrap_store(store);
    NodePtr node = proxy->resolve("/secret");
    ASSERT_FS_ERROR(node->require<Readable>().read(), ErrorCode::PermissionDenied);
    ASSERT_FS_ERROR(proxy->resolve("/missing")->require<Readable>().read(), ErrorCode::NotFound);
    ASSERT_EQ(proxy->reconnect_count(), 0u);
    ASSERT_EQ(store->session_count(), 2u);
}

void test_proxy_write_survives_disconnect() {
    std::cout << "  test_proxy_write_survives_disconnect..." << std::endl;

    auto store = MemoryStore::create("write");
    auto proxy = wrap_store(store);
    NodePtr node = proxy->resolve("/log.txt");

    auto out = node->require<Writable>().open_for_writing();
    out->write(std::string("abc"));
    store->fail_after(0);
    out->write(std::string("def"));
    out->close();

    ASSERT_EQ(node->require<Readable>().read_string(), "abcdef");
    ASSERT_EQ(proxy->reconnect_count(), 1u);
}

void test_proxy_write_reconciles_persisted_bytes() {
    std::cout << "  test_proxy_write_reconciles_persisted_bytes..." << std::endl;

    auto store = MemoryStore::create("persist");
    auto proxy = ReconnectingFileSystem::wrap([store] {
        // Sessions on the current epoch, declaring MayPersist
        uint64_t epoch = store->connect()->session();
        return std::make_shared<PersistingMemoryFileSystem>(store, epoch);
    });
    ASSERT_TRUE(proxy->in_flight_writes() == InFlightWrites::MayPersist);

    NodePtr node = proxy->resolve("/journal");
    node->require<Writable>().write("head|");

    auto out = node->require<Writable>().open_for_writing(true);
    out->write(std::string("one|"));
    store->fail_after(0);
    out->write(std::string("two|"));
    out->close();
    ASSERT_EQ(node->require<Readable>().read_string(), "head|one|two|");

    // Acknowledged bytes that vanished while disconnected are an error
    auto again = node->require<Writable>().open_for_writing(true);
    again->write(std::string("three|"));
    store->disconnect_all();
    store->connect()->resolve("/journal")->require<Writable>().write("");
    ASSERT_FS_ERROR(again->write(std::string("four|")), ErrorCode::IOFailure);
}

void test_proxy_read_detects_shrunk_file() {
    std::cout << "  test_proxy_read_detects_shrunk_file..." << std::endl;

    auto store = MemoryStore::create("shrink");
    store->connect()->resolve("/data")->require<Writable>().write(pattern_text(30000));

    auto proxy = wrap_store(store);
    auto stream = proxy->resolve("/data")->require<Readable>().open_for_reading();
    ASSERT_EQ(stream->read_block(20000).size(), 20000u);

    store->disconnect_all();
    store->connect()->resolve("/data")->require<Writable>().write(pattern_text(100));
    ASSERT_FS_ERROR(stream->read_block(20000), ErrorCode::IOFailure);
}

void test_proxy_second_disconnect_propagates() {
    std::cout << "  test_proxy_second_disconnect_propagates..." << std::endl;

    auto store = MemoryStore::create("flaky");
    auto calls = std::make_shared<int>(0);
    auto proxy = ReconnectingFileSystem::wrap([store, calls] {
        auto session = store->connect();
        // Every rebuilt session is dead on arrival
        if ((*calls)++ > 0) {
            store->disconnect_all();
        }
        return session;
    });

    NodePtr node = proxy->resolve("/x");
    store->disconnect_all();
    ASSERT_FS_ERROR(node->require<Readable>().exists(), ErrorCode::Disconnected);
    ASSERT_EQ(proxy->reconnect_count(), 1u);
}

void test_proxy_factory_failure() {
    std::cout << "  test_proxy_factory_failure..." << std::endl;

    auto store = MemoryStore::create("factory");
    auto refuse = std::make_shared<bool>(false);
    auto proxy = ReconnectingFileSystem::wrap([store, refuse]() -> FileSystemPtr {
        if (*refuse) {
            throw FSError(ErrorCode::PermissionDenied, "memory:factory", "Login refused");
        }
        return store->connect();
    });
    NodePtr node = proxy->resolve("/y");

    *refuse = true;
    store->disconnect_all();
    ASSERT_FS_ERROR(node->require<Readable>().exists(), ErrorCode::PermissionDenied);
    ASSERT_EQ(proxy->generation(), 0u);
    ASSERT_TRUE(proxy->state() == ReconnectingFileSystem::State::Connected);

    // The next call retries the rebuild
    *refuse = false;
    ASSERT_FALSE(node->require<Readable>().exists());
    ASSERT_EQ(proxy->generation(), 1u);

    ASSERT_THROWS(ReconnectingFileSystem::wrap([]() -> FileSystemPtr { return nullptr; }), FSError);
}

void test_proxy_stale_reconnect_is_noop() {
    std::cout << "  test_proxy_stale_reconnect_is_noop..." << std::endl;

    auto store = MemoryStore::create("stale");
    auto proxy = wrap_store(store);
    proxy->reconnect(0);
    ASSERT_EQ(proxy->generation(), 1u);
    proxy->reconnect(0);
    ASSERT_EQ(proxy->generation(), 1u);
    ASSERT_EQ(proxy->reconnect_count(), 1u);
}

void test_proxy_concurrent_disconnect() {
    std::cout << "  test_proxy_concurrent_disconnect..." << std::endl;

    auto store = MemoryStore::create("concurrent");
    store->connect()->resolve("/shared")->require<Writable>().write(pattern_text(5000));
    auto proxy = wrap_store(store);
    NodePtr node = proxy->resolve("/shared");

    store->disconnect_all();
    std::vector<std::thread> workers;
    std::vector<size_t> sizes(4, 0);
    for (size_t i = 0; i < sizes.size(); ++i) {
        workers.emplace_back([&node, &sizes, i] {
            sizes[i] = node->require<Readable>().read().size();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (size_t size : sizes) {
        ASSERT_EQ(size, 5000u);
    }
    ASSERT_EQ(proxy->reconnect_count(), 1u);
}

void run_proxy_tests() {
    std::cout << "=== Reconnecting Proxy Tests ===" << std::endl;
    test_proxy_mirrors_capabilities();
    test_proxy_wraps_returned_nodes();
    test_proxy_read_survives_disconnect();
    test_proxy_hash_survives_disconnect();
    test_proxy_working_folder_survives_disconnect();
    test_proxy_permission_not_retried();
    test_proxy_write_survives_disconnect();
    test_proxy_write_reconciles_persisted_bytes();
    test_proxy_read_detects_shrunk_file();
    test_proxy_second_disconnect_propagates();
    test_proxy_factory_failure();
    test_proxy_stale_reconnect_is_noop();
    test_proxy_concurrent_disconnect();
    std::cout << "  Reconnecting Proxy tests completed" << std::endl << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "nodefs Reconnect Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        run_memory_tests();
        run_proxy_tests();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests completed successfully!" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

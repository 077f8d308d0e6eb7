#pragma once

#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"
#include <map>
#include <mutex>

namespace nodefs {

class MemoryFileSystem;

// In-process "server" holding a tree of files, folders and links
// Clients talk to it through sessions (MemoryFileSystem instances). Every
// session call is one round trip that can be made to fail, which makes the
// store a stand-in for a remote endpoint:
//
//   auto store = MemoryStore::create("scratch");
//   auto fs = store->connect();
//   store->fail_after(3);   // the fourth call from now severs every session
class MemoryStore : public std::enable_shared_from_this<MemoryStore> {
public:
    enum class Kind { File, Folder, Link };

    struct Entry {
        Kind kind = Kind::File;
        Block data;
        std::string link_target;
        std::map<std::string, std::string> xattrs;
        bool readable = true;
        bool writable = true;
    };

    static std::shared_ptr<MemoryStore> create(std::string name);

    const std::string& name() const { return name_; }

    // Open a new session bound to the current connection epoch
    std::shared_ptr<MemoryFileSystem> connect();

    // Sever every open session; later sessions are unaffected
    void disconnect_all();

    // Let `calls` more round trips succeed, then sever every open session
    void fail_after(size_t calls);

    // Deny reads and/or writes of the entry at path
    void set_permissions(const Path& path, bool readable, bool writable);

    size_t session_count() const;
    size_t round_trips() const;

    // Session round trips; each checks the session first
    // Calls through a severed session throw FSError(Disconnected)
    std::optional<Kind> stat(uint64_t session, const Path& path, bool follow_links);
    std::optional<std::string> read_link(uint64_t session, const Path& path);
    std::optional<std::vector<std::string>> list(uint64_t session, const Path& path);
    size_t read(uint64_t session, const Path& path, uint64_t offset, std::byte* buffer, size_t size);
    uint64_t size(uint64_t session, const Path& path);
    void open_file(uint64_t session, const Path& path, bool truncate);
    void append(uint64_t session, const Path& path, const std::byte* data, size_t size);
    void make_folder(uint64_t session, const Path& path);
    void make_link(uint64_t session, const Path& path, const std::string& target);
    void remove(uint64_t session, const Path& path);
    void check_folder(uint64_t session, const Path& path);

    std::string get_xattr(uint64_t session, const Path& path, const std::string& name);
    void set_xattr(uint64_t session, const Path& path, const std::string& name, const std::string& value);
    void delete_xattr(uint64_t session, const Path& path, const std::string& name);
    std::vector<std::string> list_xattrs(uint64_t session, const Path& path);

private:
    explicit MemoryStore(std::string name);

    // Require lock_ held
    void check_session(uint64_t session, const Path& path);
    Entry* find(const Path& path);
    Entry* find_following(const Path& path, Path* resolved = nullptr);
    Entry& require(const Path& path, bool follow_links);
    void require_parent_folder(const Path& path);

    std::string name_;
    mutable std::mutex lock_;
    std::map<Path, Entry> entries_;
    uint64_t epoch_ = 0;
    size_t countdown_ = 0;  // 0: no failure scheduled
    size_t sessions_ = 0;
    size_t round_trips_ = 0;
};

// One session with a MemoryStore
class MemoryFileSystem : public FileSystem {
public:
    MemoryFileSystem(std::shared_ptr<MemoryStore> store, uint64_t session);

    std::string name() const override { return "memory:" + store_->name(); }
    std::vector<NodePtr> roots() override;

    const std::shared_ptr<MemoryStore>& store() const { return store_; }
    uint64_t session() const { return session_; }

    // Session-scoped working folder
    const Path& working() const { return working_; }
    void set_working(Path path) { working_ = std::move(path); }

private:
    std::shared_ptr<MemoryStore> store_;
    uint64_t session_;
    Path working_;
};

class MemoryNode : public Node,
                   public Hierarchy,
                   public ExtendedAttributes,
                   public Listable,
                   public Readable,
                   public Sizable,
                   public WorkingDirectory,
                   public Writable {
public:
    MemoryNode(std::shared_ptr<MemoryFileSystem> filesystem, Path path);

    // Hierarchy
    NodePtr parent() override;
    NodePtr child(const std::string& name) override;
    std::vector<std::string> get_path_components() override;

    // ExtendedAttributes
    std::string get_xattr(const std::string& name) override;
    void set_xattr(const std::string& name, const std::string& value) override;
    void delete_xattr(const std::string& name) override;
    std::vector<std::string> list_xattrs() override;

    // Listable
    std::optional<std::vector<std::string>> child_names() override;

    // Readable
    bool is_file() override;
    bool is_folder() override;
    bool exists() override;
    std::optional<std::string> link_target() override;
    std::unique_ptr<ReadStream> open_for_reading() override;

    // Sizable
    uint64_t size() override;

    // WorkingDirectory
    void change_to() override;
    NodePtr current_working() override;

    // Writable
    std::unique_ptr<WriteStream> open_for_writing(bool append = false) override;
    void create_folder() override;
    void link_to(const std::string& target) override;
    void delete_just_this_thing() override;

private:
    MemoryStore& store() const { return *session_->store(); }
    NodePtr make(Path path) const;

    std::shared_ptr<MemoryFileSystem> session_;
};

} // namespace nodefs

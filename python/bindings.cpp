#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "nodefs/nodefs.hpp"

namespace py = pybind11;
using namespace nodefs;

namespace {

py::bytes to_bytes(const Block& block) {
    return py::bytes(reinterpret_cast<const char*>(block.data()), block.size());
}

Block from_bytes(const py::bytes& data) {
    std::string text = data;
    const std::byte* begin = reinterpret_cast<const std::byte*>(text.data());
    return Block(begin, begin + text.size());
}

} // anonymous namespace

PYBIND11_MODULE(pynodefs, m) {
    m.doc() = "nodefs - Python bindings";

    // Error codes
    py::enum_<ErrorCode>(m, "ErrorCode")
        .value("NotFound", ErrorCode::NotFound)
        .value("AlreadyExists", ErrorCode::AlreadyExists)
        .value("UnsupportedOperation", ErrorCode::UnsupportedOperation)
        .value("PermissionDenied", ErrorCode::PermissionDenied)
        .value("BrokenLink", ErrorCode::BrokenLink)
        .value("Disconnected", ErrorCode::Disconnected)
        .value("IOFailure", ErrorCode::IOFailure)
        .value("PathEscape", ErrorCode::PathEscape)
        .value("NotAFolder", ErrorCode::NotAFolder)
        .value("NotAFile", ErrorCode::NotAFile)
        .value("InvalidPath", ErrorCode::InvalidPath)
        .value("ConfigError", ErrorCode::ConfigError)
        .export_values();

    // FSError exception
    py::register_exception<FSError>(m, "FSError");

    // Path class
    py::class_<Path>(m, "Path")
        .def(py::init<std::string, std::vector<std::string>>(),
             py::arg("root"), py::arg("components") = std::vector<std::string>())
        .def_static("parse", &Path::parse, py::arg("text"), py::arg("root") = "/")
        .def("root", &Path::root)
        .def("components", &Path::components)
        .def("is_root", &Path::is_root)
        .def("name", &Path::name)
        .def("parent", &Path::parent)
        .def("join", &Path::join)
        .def("resolve", &Path::resolve)
        .def("is_ancestor_of", &Path::is_ancestor_of)
        .def("__eq__", &Path::operator==)
        .def("__hash__", &Path::hash)
        .def("__str__", [](const Path& p) { return p.str(); })
        .def("__repr__", [](const Path& p) { return "Path('" + p.str() + "')"; });

    // Address class
    py::class_<Address>(m, "Address")
        .def_static("parse", &Address::parse)
        .def("has_name", &Address::has_name)
        .def("is_url", &Address::is_url)
        .def("name", &Address::name)
        .def("path", &Address::path)
        .def("__str__", &Address::to_string);

    // Node: capability operations dispatched through require<>()
    py::class_<Node, std::shared_ptr<Node>>(m, "Node")
        .def("path", [](Node& n) { return n.path().str(); })
        .def("capabilities", [](Node& n) { return n.capabilities().to_string(); })
        .def("describe", &Node::describe)
        .def("__eq__", [](Node& a, Node& b) { return a == b; })
        .def("__repr__", [](Node& n) { return "Node('" + n.describe() + "')"; })
        // Hierarchy
        .def("parent", [](Node& n) { return n.require<Hierarchy>().parent(); })
        .def("child", [](Node& n, const std::string& name) { return n.require<Hierarchy>().child(name); })
        .def("safe_child", [](Node& n, const std::string& name) {
            return n.require<Hierarchy>().safe_child(name);
        })
        .def("name", [](Node& n) { return n.require<Hierarchy>().name(); })
        .def("ancestors", [](Node& n) { return n.require<Hierarchy>().ancestors(); })
        .def("is_mount", [](Node& n) { return n.require<Hierarchy>().is_mount(); })
        // ExtendedAttributes
        .def("get_xattr", [](Node& n, const std::string& k) { return n.require<ExtendedAttributes>().get_xattr(k); })
        .def("set_xattr", [](Node& n, const std::string& k, const std::string& v) {
            n.require<ExtendedAttributes>().set_xattr(k, v);
        })
        .def("delete_xattr", [](Node& n, const std::string& k) { n.require<ExtendedAttributes>().delete_xattr(k); })
        .def("list_xattrs", [](Node& n) { return n.require<ExtendedAttributes>().list_xattrs(); })
        // Listable
        .def("children", [](Node& n) { return n.require<Listable>().children().to_vector(); })
        .def("glob", [](Node& n, const std::string& pattern) {
            return n.require<Listable>().glob(pattern).to_vector();
        })
        .def("recurse", [](Node& n, bool include_self, bool follow_links) {
            RecurseFilter filter = follow_links ? RecurseFilter() : RecurseFilter(&Listable::stop_at_links);
            return n.require<Listable>().recurse(filter, include_self).to_vector();
        }, py::arg("include_self") = true, py::arg("follow_links") = true)
        // Readable
        .def("exists", [](Node& n) { return n.require<Readable>().exists(); })
        .def("is_file", [](Node& n) { return n.require<Readable>().is_file(); })
        .def("is_folder", [](Node& n) { return n.require<Readable>().is_folder(); })
        .def("is_link", [](Node& n) { return n.require<Readable>().is_link(); })
        .def("link_target", [](Node& n) { return n.require<Readable>().link_target(); })
        .def("dereference", [](Node& n, bool recursive) {
            return n.require<Readable>().dereference(recursive);
        }, py::arg("recursive") = false)
        .def("read", [](Node& n) { return to_bytes(n.require<Readable>().read()); })
        .def("read_string", [](Node& n) { return n.require<Readable>().read_string(); })
        .def("hash", [](Node& n, const std::string& algorithm) {
            return n.require<Readable>().hash(algorithm);
        }, py::arg("algorithm") = "md5")
        .def("copy_to", [](Node& n, Node& destination, bool overwrite, bool dereference_links) {
            CopyOptions options;
            options.overwrite = overwrite;
            options.dereference_links = dereference_links;
            n.require<Readable>().copy_to(destination, options);
        }, py::arg("destination"), py::arg("overwrite") = false, py::arg("dereference_links") = true)
        // Sizable
        .def("size", [](Node& n) { return n.require<Sizable>().size(); })
        // WorkingDirectory
        .def("cd", [](Node& n) { n.require<WorkingDirectory>().cd(); })
        // Writable
        .def("write", [](Node& n, const py::bytes& data) { n.require<Writable>().write(from_bytes(data)); })
        .def("append", [](Node& n, const py::bytes& data) { n.require<Writable>().append(from_bytes(data)); })
        .def("mkdir", [](Node& n, bool silent) { n.require<Writable>().mkdir(silent); }, py::arg("silent") = false)
        .def("mkdirs", [](Node& n, bool silent) { n.require<Writable>().mkdirs(silent); }, py::arg("silent") = false)
        .def("link_to", [](Node& n, const std::string& target) { n.require<Writable>().link_to(target); })
        .def("remove", [](Node& n, bool ignore_missing) {
            n.require<Writable>().remove(ignore_missing);
        }, py::arg("ignore_missing") = false)
        .def("rename_to", [](Node& n, Node& destination) { n.require<Writable>().rename_to(destination); });

    // FileSystem class
    py::class_<FileSystem, std::shared_ptr<FileSystem>>(m, "FileSystem")
        .def("name", &FileSystem::name)
        .def("roots", &FileSystem::roots)
        .def("root", &FileSystem::root)
        .def("resolve", [](FileSystem& fs, const std::string& text) { return fs.resolve(text); });

    py::class_<ReconnectingFileSystem, FileSystem, std::shared_ptr<ReconnectingFileSystem>>(m, "ReconnectingFileSystem")
        .def_static("wrap", &ReconnectingFileSystem::wrap)
        .def("generation", &ReconnectingFileSystem::generation)
        .def("reconnect_count", &ReconnectingFileSystem::reconnect_count);

    py::class_<MemoryStore, std::shared_ptr<MemoryStore>>(m, "MemoryStore")
        .def_static("create", &MemoryStore::create)
        .def("connect", [](MemoryStore& s) -> FileSystemPtr { return s.connect(); })
        .def("disconnect_all", &MemoryStore::disconnect_all)
        .def("fail_after", &MemoryStore::fail_after);

    m.def("local_filesystem", []() -> FileSystemPtr { return local_filesystem(); });

    // Registry class
    py::class_<Registry>(m, "Registry")
        .def(py::init<>())
        .def(py::init<const std::string&>(), py::arg("config_path"))
        .def("get", &Registry::get)
        .def("names", &Registry::names)
        .def("size", &Registry::size)
        .def("__len__", &Registry::size)
        .def("resolve", [](const Registry& r, const std::string& address) { return r.resolve(address); });
}

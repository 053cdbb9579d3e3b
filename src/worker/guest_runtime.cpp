/*
 * ScriptCell C++ - Guest Runtime Implementation
 */
#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <scriptcell/worker/guest_runtime.hpp>
#include <scriptcell/core/sandbox.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <new>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace scriptcell {
namespace worker {

namespace {

const char* const RUNTIME_CAPSULE = "scriptcell.guest_runtime";

// Modules loaded before the hooks are armed, besides the allow-list
const char* const PRELOAD_MODULES[] = {
    "traceback",
    "linecache",
    "unicodedata",
    NULL
};

// Interpreter library locations readable inside the jail, besides sys.path
const char* const SYSTEM_LIBRARY_DIRS[] = {
    "/usr/lib",
    "/usr/lib64",
    "/lib",
    "/lib64",
    NULL
};

// Longest exception text reported; tracebacks keep their tail
const size_t MAX_EXCEPTION_BYTES = 64 * 1024;

// Audited operations module loading performs on its own behalf
const char* const IMPORT_OPERATIONS[] = {
    "compile",
    "exec",
    "marshal.loads",
    "os.listdir",
    "os.scandir",
    NULL
};

// Syscalls the process filter traps, by the name Sandbox reports
const char* const TRAPPED_SYSCALLS[] = {
    "clone",
    "fork",
    "vfork",
    "execve",
    "execveat",
    NULL
};

// ============ Fail-stop records ============
// Written from the allocator and from the SIGSYS handler, where nothing
// may allocate, so they are serialized before the guest starts.

std::string g_memory_record;
std::vector<std::pair<std::string, std::string> > g_trap_records;
bool g_allocation_guard = false;

// Async-signal-safe
void write_fully(const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = write(protocol::REPORT_FD, data + written, size - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            // Host is gone; nobody is left to tell
            return;
        }
    }
}

void on_trapped_syscall(int, siginfo_t* info, void*) {
    const char* name = Sandbox::filtered_syscall_name(info->si_syscall);
    for (size_t i = 0; name != NULL && i < g_trap_records.size(); ++i) {
        if (strcmp(g_trap_records[i].first.c_str(), name) == 0) {
            write_fully(g_trap_records[i].second.data(), g_trap_records[i].second.size());
            break;
        }
    }
    _exit(protocol::EXIT_VIOLATION);
}

// ============ Allocation guard ============
// While the guest runs, an allocation the address-space limit refuses
// ends the process instead of raising a MemoryError the guest could catch.

PyMemAllocatorEx g_raw_allocator;
PyMemAllocatorEx g_mem_allocator;
PyMemAllocatorEx g_obj_allocator;
PyObjectArenaAllocator g_arena_allocator;

void memory_breach() {
    write_fully(g_memory_record.data(), g_memory_record.size());
    _exit(protocol::EXIT_VIOLATION);
}

void* guarded_malloc(void* ctx, size_t size) {
    PyMemAllocatorEx* base = static_cast<PyMemAllocatorEx*>(ctx);
    void* ptr = base->malloc(base->ctx, size);
    if (ptr == NULL && g_allocation_guard) memory_breach();
    return ptr;
}

void* guarded_calloc(void* ctx, size_t nelem, size_t elsize) {
    PyMemAllocatorEx* base = static_cast<PyMemAllocatorEx*>(ctx);
    void* ptr = base->calloc(base->ctx, nelem, elsize);
    if (ptr == NULL && g_allocation_guard) memory_breach();
    return ptr;
}

void* guarded_realloc(void* ctx, void* ptr, size_t new_size) {
    PyMemAllocatorEx* base = static_cast<PyMemAllocatorEx*>(ctx);
    void* moved = base->realloc(base->ctx, ptr, new_size);
    if (moved == NULL && g_allocation_guard) memory_breach();
    return moved;
}

void guarded_free(void* ctx, void* ptr) {
    PyMemAllocatorEx* base = static_cast<PyMemAllocatorEx*>(ctx);
    base->free(base->ctx, ptr);
}

void* guarded_arena_alloc(void* ctx, size_t size) {
    PyObjectArenaAllocator* base = static_cast<PyObjectArenaAllocator*>(ctx);
    void* ptr = base->alloc(base->ctx, size);
    if (ptr == NULL && g_allocation_guard) memory_breach();
    return ptr;
}

void guarded_arena_free(void* ctx, void* ptr, size_t size) {
    PyObjectArenaAllocator* base = static_cast<PyObjectArenaAllocator*>(ctx);
    base->free(base->ctx, ptr, size);
}

void hook_domain(PyMemAllocatorDomain domain, PyMemAllocatorEx* base) {
    PyMem_GetAllocator(domain, base);
    PyMemAllocatorEx hook;
    hook.ctx = base;
    hook.malloc = guarded_malloc;
    hook.calloc = guarded_calloc;
    hook.realloc = guarded_realloc;
    hook.free = guarded_free;
    PyMem_SetAllocator(domain, &hook);
}

std::string utf8_of(PyObject* text) {
    if (text == NULL || !PyUnicode_Check(text)) return std::string();
    PyObject* bytes = PyUnicode_AsEncodedString(text, "utf-8", "backslashreplace");
    if (bytes == NULL) {
        PyErr_Clear();
        return std::string();
    }
    std::string out(PyBytes_AS_STRING(bytes), static_cast<size_t>(PyBytes_GET_SIZE(bytes)));
    Py_DECREF(bytes);
    return out;
}

std::string str_of(PyObject* obj) {
    if (obj == NULL) return std::string();
    PyObject* text = PyObject_Str(obj);
    if (text == NULL) {
        PyErr_Clear();
        return std::string();
    }
    std::string out = utf8_of(text);
    Py_DECREF(text);
    return out;
}

// "Type: message" for the pending Python error, which is cleared
std::string take_python_error() {
    PyObject* type = NULL;
    PyObject* value = NULL;
    PyObject* tb = NULL;
    PyErr_Fetch(&type, &value, &tb);
    PyErr_NormalizeException(&type, &value, &tb);

    std::string text = "unknown error";
    if (type != NULL) {
        text = reinterpret_cast<PyTypeObject*>(type)->tp_name;
        std::string message = str_of(value);
        if (!message.empty()) text += ": " + message;
    }
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(tb);
    return text;
}

bool frame_is_guest(PyFrameObject* frame) {
    PyCodeObject* code = PyFrame_GetCode(frame);
    bool guest = PyUnicode_CompareWithASCIIString(code->co_filename, protocol::GUEST_FILENAME) == 0;
    Py_DECREF(code);
    return guest;
}

bool guest_frame_active() {
    PyFrameObject* frame = PyEval_GetFrame();
    return frame != NULL && frame_is_guest(frame);
}

// Arguments whose hash, equality or iteration could run guest code
// in the middle of the import machinery
bool is_plain_fromlist(PyObject* fromlist) {
    if (fromlist == NULL || fromlist == Py_None) return true;
    if (!PyTuple_CheckExact(fromlist) && !PyList_CheckExact(fromlist)) return false;

    Py_ssize_t size = PySequence_Fast_GET_SIZE(fromlist);
    for (Py_ssize_t i = 0; i < size; ++i) {
        if (!PyUnicode_CheckExact(PySequence_Fast_GET_ITEM(fromlist, i))) return false;
    }
    return true;
}

bool is_read_only_open(PyObject* args) {
    if (!PyTuple_Check(args) || PyTuple_GET_SIZE(args) < 3) return false;

    PyObject* mode = PyTuple_GET_ITEM(args, 1);
    PyObject* flags = PyTuple_GET_ITEM(args, 2);

    if (mode != Py_None && PyUnicode_Check(mode)) {
        const char* m = PyUnicode_AsUTF8(mode);
        if (m == NULL) {
            PyErr_Clear();
            return false;
        }
        return strpbrk(m, "wax+") == NULL;
    }

    if (PyLong_Check(flags)) {
        long f = PyLong_AsLong(flags);
        if (f == -1 && PyErr_Occurred()) {
            PyErr_Clear();
            return false;
        }
        return (f & O_ACCMODE) == O_RDONLY && (f & (O_CREAT | O_TRUNC)) == 0;
    }
    return false;
}

// C++ exceptions must not unwind through the interpreter
PyObject* import_entry(PyObject* self, PyObject* args, PyObject* kwargs) {
    GuestRuntime* runtime = static_cast<GuestRuntime*>(PyCapsule_GetPointer(self, RUNTIME_CAPSULE));
    if (runtime == NULL) return NULL;
    try {
        return runtime->guarded_import(args, kwargs);
    } catch (const std::bad_alloc&) {
        return PyErr_NoMemory();
    }
}

PyObject* create_builtin_entry(PyObject* self, PyObject* args) {
    GuestRuntime* runtime = static_cast<GuestRuntime*>(PyCapsule_GetPointer(self, RUNTIME_CAPSULE));
    if (runtime == NULL) return NULL;
    try {
        return runtime->guarded_create(false, args);
    } catch (const std::bad_alloc&) {
        return PyErr_NoMemory();
    }
}

PyObject* create_dynamic_entry(PyObject* self, PyObject* args) {
    GuestRuntime* runtime = static_cast<GuestRuntime*>(PyCapsule_GetPointer(self, RUNTIME_CAPSULE));
    if (runtime == NULL) return NULL;
    try {
        return runtime->guarded_create(true, args);
    } catch (const std::bad_alloc&) {
        return PyErr_NoMemory();
    }
}

int audit_entry(const char* event, PyObject* args, void* user_data) {
    try {
        return static_cast<GuestRuntime*>(user_data)->audit(event, args);
    } catch (const std::bad_alloc&) {
        PyErr_NoMemory();
        return -1;
    }
}

PyMethodDef import_def = {
    "__import__",
    reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(import_entry)),
    METH_VARARGS | METH_KEYWORDS,
    "Import a module permitted by the capability policy."
};

PyMethodDef create_builtin_def = {
    "create_builtin",
    create_builtin_entry,
    METH_VARARGS,
    "Create a built-in module permitted by the capability policy."
};

PyMethodDef create_dynamic_def = {
    "create_dynamic",
    create_dynamic_entry,
    METH_VARARGS,
    "Load an extension module permitted by the capability policy."
};

} // anonymous namespace

// ============ Lifecycle ============

GuestRuntime::GuestRuntime(const protocol::WorkerRequest& request)
    : request_(request)
    , policy_(request.allowed_modules, request.denied_operations)
    , phase_(GuestPhase::SETUP)
    , import_depth_(0)
    , builtins_(NULL)
    , original_import_(NULL)
    , format_exception_(NULL)
    , guest_code_(NULL)
    , guest_code_started_(false)
    , create_builtin_(NULL)
    , create_dynamic_(NULL)
    , spec_type_(NULL) {}

int GuestRuntime::run() {
    std::string error;

    if (!initialize_interpreter(error)) return fail_setup(error);
    if (!install_hooks(error)) return fail_setup(error);
    if (!warm_up(error)) return fail_setup(error);
    if (!register_source(error)) return fail_setup(error);
    if (!guard_module_creation(error)) return fail_setup(error);

    std::string syntax_error;
    PyObject* code = compile_guest(syntax_error);
    if (code == NULL) {
        return finish(protocol::FinishStatus::SYNTAX_ERROR, 1, "Invalid Python syntax: " + syntax_error);
    }

    bool landlock = false;
    if (!confine(landlock, error)) {
        Py_DECREF(code);
        return fail_setup(error);
    }

    guard_allocations();
    send(protocol::ReportRecord::ready(landlock));
    int status = execute(code);
    Py_DECREF(code);
    return status;
}

bool GuestRuntime::initialize_interpreter(std::string& error) {
    PyPreConfig preconfig;
    PyPreConfig_InitIsolatedConfig(&preconfig);
    preconfig.utf8_mode = 1;

    PyStatus status = Py_PreInitialize(&preconfig);
    if (PyStatus_Exception(status)) {
        error = std::string("Python pre-initialization failed: ") + (status.err_msg ? status.err_msg : "unknown");
        return false;
    }

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.buffered_stdio = 0;          // Output survives a SIGKILL
    config.site_import = 0;
    config.write_bytecode = 0;
    config.install_signal_handlers = 0;
    config.user_site_directory = 0;
    config.pathconfig_warnings = 0;

    status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        error = std::string("Python initialization failed: ") + (status.err_msg ? status.err_msg : "unknown");
        return false;
    }

    if (request_.recursion_limit > 0) {
        Py_SetRecursionLimit(request_.recursion_limit);
    }
    return true;
}

bool GuestRuntime::install_hooks(std::string& error) {
    if (PySys_AddAuditHook(audit_entry, this) < 0) {
        error = "Cannot install audit hook: " + take_python_error();
        return false;
    }

    builtins_ = PyImport_ImportModule("builtins");
    if (builtins_ == NULL) {
        error = "Cannot load builtins: " + take_python_error();
        return false;
    }

    // The original lives only here; the guest never sees it
    original_import_ = PyObject_GetAttrString(builtins_, "__import__");
    if (original_import_ == NULL) {
        error = "Cannot find __import__: " + take_python_error();
        return false;
    }

    PyObject* capsule = PyCapsule_New(this, RUNTIME_CAPSULE, NULL);
    if (capsule == NULL) {
        error = "Cannot wrap runtime: " + take_python_error();
        return false;
    }
    PyObject* guarded = PyCFunction_NewEx(&import_def, capsule, NULL);
    Py_DECREF(capsule);
    if (guarded == NULL || PyObject_SetAttrString(builtins_, "__import__", guarded) < 0) {
        Py_XDECREF(guarded);
        error = "Cannot replace __import__: " + take_python_error();
        return false;
    }
    Py_DECREF(guarded);
    return true;
}

bool GuestRuntime::warm_up(std::string& error) {
    // A module that does not exist simply fails to import later, in the guest
    for (const auto& name : policy_.allowed_modules()) {
        PyObject* module = PyImport_ImportModule(name.c_str());
        if (module == NULL) {
            PyErr_Clear();
            continue;
        }
        Py_DECREF(module);
    }

    for (int i = 0; PRELOAD_MODULES[i] != NULL; ++i) {
        PyObject* module = PyImport_ImportModule(PRELOAD_MODULES[i]);
        if (module == NULL) {
            PyErr_Clear();
            continue;
        }
        if (strcmp(PRELOAD_MODULES[i], "traceback") == 0) {
            format_exception_ = PyObject_GetAttrString(module, "format_exception");
        }
        Py_DECREF(module);
    }

    if (format_exception_ == NULL) {
        error = "Cannot load traceback.format_exception: " + take_python_error();
        return false;
    }

    // Format one exception so everything formatting touches is loaded
    PyObject* sample = PyObject_CallFunction(PyExc_ZeroDivisionError, "s", "warm-up");
    if (sample != NULL) {
        PyObject* lines = PyObject_CallFunctionObjArgs(format_exception_, sample, NULL);
        Py_XDECREF(lines);
        Py_DECREF(sample);
    }
    PyErr_Clear();
    return true;
}

bool GuestRuntime::register_source(std::string& error) {
    // Guest tracebacks show source lines without reading any file
    PyObject* linecache = PyImport_ImportModule("linecache");
    if (linecache == NULL) {
        error = "Cannot load linecache: " + take_python_error();
        return false;
    }
    PyObject* cache = PyObject_GetAttrString(linecache, "cache");
    Py_DECREF(linecache);
    if (cache == NULL) {
        error = "Cannot access linecache: " + take_python_error();
        return false;
    }

    bool ok = false;
    PyObject* text = PyUnicode_DecodeUTF8(request_.source.data(),
                                          static_cast<Py_ssize_t>(request_.source.size()), "replace");
    PyObject* lines = text ? PyUnicode_Splitlines(text, 1) : NULL;
    if (lines != NULL) {
        PyObject* entry = Py_BuildValue("(nOOs)", static_cast<Py_ssize_t>(request_.source.size()),
                                        Py_None, lines, protocol::GUEST_FILENAME);
        if (entry != NULL) {
            ok = PyDict_SetItemString(cache, protocol::GUEST_FILENAME, entry) == 0;
            Py_DECREF(entry);
        }
    }
    Py_XDECREF(lines);
    Py_XDECREF(text);
    Py_DECREF(cache);

    if (!ok) {
        error = "Cannot register guest source: " + take_python_error();
    }
    return ok;
}

bool GuestRuntime::guard_module_creation(std::string& error) {
    // The import system finishes every built-in and extension module load
    // through these two functions, whichever path started it
    PyObject* imp = PyImport_ImportModule("_imp");
    if (imp == NULL) {
        error = "Cannot load _imp: " + take_python_error();
        return false;
    }

    // Trusted module specs are built from this type, which the guest cannot patch
    PyObject* implementation = PySys_GetObject("implementation");
    if (implementation == NULL) {
        Py_DECREF(imp);
        error = "Cannot find sys.implementation";
        return false;
    }
    spec_type_ = reinterpret_cast<PyObject*>(Py_TYPE(implementation));
    Py_INCREF(spec_type_);

    create_builtin_ = PyObject_GetAttrString(imp, "create_builtin");
    if (create_builtin_ == NULL) {
        Py_DECREF(imp);
        error = "Cannot find _imp.create_builtin: " + take_python_error();
        return false;
    }
    // Absent when the interpreter cannot load extension modules at all
    create_dynamic_ = PyObject_GetAttrString(imp, "create_dynamic");
    if (create_dynamic_ == NULL) PyErr_Clear();

    PyObject* capsule = PyCapsule_New(this, RUNTIME_CAPSULE, NULL);
    if (capsule == NULL) {
        Py_DECREF(imp);
        error = "Cannot wrap runtime: " + take_python_error();
        return false;
    }

    bool ok = true;
    PyObject* builtin = PyCFunction_NewEx(&create_builtin_def, capsule, NULL);
    if (builtin == NULL || PyObject_SetAttrString(imp, "create_builtin", builtin) < 0) ok = false;
    Py_XDECREF(builtin);

    if (ok && create_dynamic_ != NULL) {
        PyObject* dynamic = PyCFunction_NewEx(&create_dynamic_def, capsule, NULL);
        if (dynamic == NULL || PyObject_SetAttrString(imp, "create_dynamic", dynamic) < 0) ok = false;
        Py_XDECREF(dynamic);
    }

    Py_DECREF(capsule);
    Py_DECREF(imp);
    if (!ok) {
        error = "Cannot replace module loaders: " + take_python_error();
    }
    return ok;
}

PyObject* GuestRuntime::compile_guest(std::string& syntax_error) {
    if (request_.source.find('\0') != std::string::npos) {
        syntax_error = "source code string cannot contain null bytes";
        return NULL;
    }

    PyObject* code = Py_CompileStringExFlags(request_.source.c_str(), protocol::GUEST_FILENAME,
                                             Py_file_input, NULL, 0);
    if (code == NULL) {
        PyObject* type = NULL;
        PyObject* value = NULL;
        PyObject* tb = NULL;
        PyErr_Fetch(&type, &value, &tb);
        PyErr_NormalizeException(&type, &value, &tb);
        syntax_error = str_of(value);
        if (syntax_error.empty() && type != NULL) {
            syntax_error = reinterpret_cast<PyTypeObject*>(type)->tp_name;
        }
        Py_XDECREF(type);
        Py_XDECREF(value);
        Py_XDECREF(tb);
    }
    return code;
}

bool GuestRuntime::confine(bool& landlock, std::string& error) {
    Sandbox& sandbox = Sandbox::instance();

    PyObject* path = PySys_GetObject("path");
    if (path != NULL && PyList_Check(path)) {
        for (Py_ssize_t i = 0; i < PyList_GET_SIZE(path); ++i) {
            sandbox.allow_read_only(utf8_of(PyList_GET_ITEM(path, i)));
        }
    }
    for (int i = 0; SYSTEM_LIBRARY_DIRS[i] != NULL; ++i) {
        sandbox.allow_read_only(SYSTEM_LIBRARY_DIRS[i]);
    }
    for (size_t i = 0; i < request_.readonly_paths.size(); ++i) {
        sandbox.allow_read_only(request_.readonly_paths[i]);
    }

    landlock = sandbox.activate();
    if (!landlock && request_.require_landlock) {
        error = "Landlock confinement unavailable: " + sandbox.last_error();
        return false;
    }

    for (int i = 0; TRAPPED_SYSCALLS[i] != NULL; ++i) {
        protocol::ReportRecord record = protocol::ReportRecord::denied(CapabilityError::OPERATION_DENIED,
                                                                       TRAPPED_SYSCALLS[i]);
        record.token = request_.token;
        g_trap_records.push_back(std::make_pair(std::string(TRAPPED_SYSCALLS[i]), record.serialize()));
    }

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_sigaction = on_trapped_syscall;
    action.sa_flags = SA_SIGINFO;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGSYS, &action, NULL) != 0) {
        error = std::string("Cannot install SIGSYS handler: ") + strerror(errno);
        return false;
    }

    // Kernel backstop for process creation, whatever the guest reaches
    if (!sandbox.deny_process_creation()) {
        error = "Process creation filter unavailable: " + sandbox.last_error();
        return false;
    }
    return true;
}

void GuestRuntime::guard_allocations() {
    protocol::ReportRecord record = protocol::ReportRecord::finished(protocol::FinishStatus::MEMORY, 1, std::string());
    record.token = request_.token;
    g_memory_record = record.serialize();

    hook_domain(PYMEM_DOMAIN_RAW, &g_raw_allocator);
    hook_domain(PYMEM_DOMAIN_MEM, &g_mem_allocator);
    hook_domain(PYMEM_DOMAIN_OBJ, &g_obj_allocator);

    PyObject_GetArenaAllocator(&g_arena_allocator);
    PyObjectArenaAllocator arena;
    arena.ctx = &g_arena_allocator;
    arena.alloc = guarded_arena_alloc;
    arena.free = guarded_arena_free;
    PyObject_SetArenaAllocator(&arena);
}

int GuestRuntime::execute(PyObject* code) {
    PyObject* globals = PyDict_New();
    PyObject* main_name = PyUnicode_FromString("__main__");
    if (globals == NULL || main_name == NULL ||
        PyDict_SetItemString(globals, "__name__", main_name) < 0 ||
        PyDict_SetItemString(globals, "__builtins__", builtins_) < 0) {
        Py_XDECREF(main_name);
        Py_XDECREF(globals);
        return fail_setup("Cannot create guest namespace: " + take_python_error());
    }
    Py_DECREF(main_name);

    guest_code_ = code;
    phase_ = GuestPhase::GUEST;
    g_allocation_guard = true;
    PyObject* result = PyEval_EvalCode(code, globals, globals);
    g_allocation_guard = false;
    phase_ = GuestPhase::REPORTING;

    if (result != NULL) {
        Py_DECREF(result);
        return finish(protocol::FinishStatus::COMPLETED, 0, std::string());
    }

    PyObject* type = NULL;
    PyObject* value = NULL;
    PyObject* tb = NULL;
    PyErr_Fetch(&type, &value, &tb);
    PyErr_NormalizeException(&type, &value, &tb);
    if (value != NULL && tb != NULL) {
        PyException_SetTraceback(value, tb);
    }

    int status;
    if (type == NULL) {
        status = finish(protocol::FinishStatus::EXCEPTION, 1, "SystemError: guest ended without a result");
    } else if (PyErr_GivenExceptionMatches(type, PyExc_SystemExit)) {
        status = finish_system_exit(value);
    } else if (PyErr_GivenExceptionMatches(type, PyExc_MemoryError)) {
        status = finish(protocol::FinishStatus::MEMORY, 1, std::string());
    } else {
        status = finish(protocol::FinishStatus::EXCEPTION, 1, format_exception(type, value));
    }

    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(tb);
    return status;
}

// ============ Reporting ============

void GuestRuntime::send(protocol::ReportRecord record) const {
    record.token = request_.token;
    std::string line = record.serialize();
    write_fully(line.data(), line.size());
}

int GuestRuntime::finish(protocol::FinishStatus status, int exit_code, const std::string& exception) {
    send(protocol::ReportRecord::finished(status, exit_code, exception));
    return 0;
}

int GuestRuntime::finish_system_exit(PyObject* value) {
    PyObject* code = value ? PyObject_GetAttrString(value, "code") : NULL;
    if (code == NULL) {
        PyErr_Clear();
        return finish(protocol::FinishStatus::COMPLETED, 1, std::string());
    }

    int exit_code;
    if (code == Py_None) {
        exit_code = 0;
    } else if (PyLong_Check(code)) {
        long v = PyLong_AsLong(code);
        if (v == -1 && PyErr_Occurred()) {
            PyErr_Clear();
            v = 1;
        }
        exit_code = static_cast<int>(v);
    } else {
        // sys.exit("message"): message to stderr, status 1
        PyObject* err = PySys_GetObject("stderr");
        if (err == NULL || err == Py_None ||
            PyFile_WriteObject(code, err, Py_PRINT_RAW) < 0 ||
            PyFile_WriteString("\n", err) < 0) {
            PyErr_Clear();
        }
        exit_code = 1;
    }
    Py_DECREF(code);
    return finish(protocol::FinishStatus::COMPLETED, exit_code, std::string());
}

int GuestRuntime::fail_setup(const std::string& message) {
    send(protocol::ReportRecord::setup_failed(message));
    return protocol::EXIT_SETUP_FAILED;
}

std::string GuestRuntime::format_exception(PyObject* type, PyObject* value) {
    std::string text;

    PyObject* lines = value ? PyObject_CallFunctionObjArgs(format_exception_, value, NULL) : NULL;
    if (lines != NULL) {
        PyObject* empty = PyUnicode_FromString("");
        PyObject* joined = empty ? PyUnicode_Join(empty, lines) : NULL;
        text = utf8_of(joined);
        Py_XDECREF(joined);
        Py_XDECREF(empty);
        Py_DECREF(lines);
    }
    PyErr_Clear();

    if (text.empty()) {
        text = reinterpret_cast<PyTypeObject*>(type)->tp_name;
        std::string message = str_of(value);
        if (!message.empty()) text += ": " + message;
    }

    while (!text.empty() && text[text.size() - 1] == '\n') {
        text.erase(text.size() - 1);
    }
    if (text.size() > MAX_EXCEPTION_BYTES) {
        text = "...\n" + text.substr(text.size() - MAX_EXCEPTION_BYTES);
    }
    return text;
}

// ============ Hooks ============

int GuestRuntime::deny(CapabilityError error, const std::string& name) {
    if (phase_ == GuestPhase::GUEST || guest_frame_active()) {
        send(protocol::ReportRecord::denied(error, name));
        _exit(protocol::EXIT_VIOLATION);
    }
    std::string message = CapabilityPolicy::violation_message(error, name);
    PyErr_SetString(PyExc_PermissionError, message.c_str());
    return -1;
}

bool GuestRuntime::is_direct_request(PyObject* globals) const {
    PyFrameObject* frame = PyEval_GetFrame();
    if (frame == NULL) return import_depth_ == 0;

    // Guest code is always checked, even when it runs inside a module load
    if (frame_is_guest(frame)) return true;
    if (import_depth_ > 0) return false;

    // A library's own import statement passes its own globals. Anything
    // else is __import__ handed over as a plain callable.
    PyObject* frame_globals = PyFrame_GetGlobals(frame);
    bool own = globals != NULL && globals == frame_globals;
    Py_XDECREF(frame_globals);
    return !own;
}

PyObject* GuestRuntime::guarded_import(PyObject* args, PyObject* kwargs) {
    static const char* keywords[] = { "name", "globals", "locals", "fromlist", "level", NULL };
    PyObject* name = NULL;
    PyObject* globals = NULL;
    PyObject* locals = NULL;
    PyObject* fromlist = NULL;
    int level = 0;

    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__", const_cast<char**>(keywords),
                                     &name, &globals, &locals, &fromlist, &level)) {
        return NULL;
    }

    if (phase_ != GuestPhase::SETUP && is_direct_request(globals)) {
        if (!PyUnicode_CheckExact(name) || !is_plain_fromlist(fromlist)) {
            PyErr_SetString(PyExc_TypeError, "__import__() arguments must be plain strings");
            return NULL;
        }
        const char* utf8 = PyUnicode_AsUTF8(name);
        if (utf8 == NULL) return NULL;

        // Relative imports resolve against a package the guest controls
        std::string module = std::string(level > 0 ? static_cast<size_t>(level) : 0, '.') + utf8;
        if (!policy_.is_module_allowed(module) && deny(CapabilityError::MODULE_DENIED, module) < 0) {
            return NULL;
        }
    }

    ++import_depth_;
    PyObject* result = PyObject_Call(original_import_, args, kwargs);
    --import_depth_;
    return result;
}

PyObject* GuestRuntime::guarded_create(bool dynamic, PyObject* args) {
    PyObject* original = dynamic ? create_dynamic_ : create_builtin_;
    if (phase_ == GuestPhase::SETUP) return PyObject_Call(original, args, NULL);

    PyObject* spec = NULL;
    PyObject* file = NULL;
    if (!PyArg_ParseTuple(args, dynamic ? "O|O:create_dynamic" : "O:create_builtin", &spec, &file)) {
        return NULL;
    }

    // Each attribute is read once. The loader gets a fresh module spec, so a
    // guest object cannot answer the check with one name and the load
    // with another.
    PyObject* name = PyObject_GetAttrString(spec, "name");
    if (name == NULL) return NULL;
    PyObject* origin = dynamic ? PyObject_GetAttrString(spec, "origin") : Py_NewRef(Py_None);
    if (origin == NULL) {
        Py_DECREF(name);
        return NULL;
    }

    PyObject* result = NULL;
    if (!PyUnicode_CheckExact(name) || (origin != Py_None && !PyUnicode_CheckExact(origin))) {
        PyErr_SetString(PyExc_TypeError, "module spec name and origin must be plain strings");
    } else if (const char* utf8 = PyUnicode_AsUTF8(name)) {
        std::string module(utf8);
        if (!policy_.is_module_allowed(module)) {
            // Returns only outside the guest phase, with PermissionError set
            deny(CapabilityError::MODULE_DENIED, module);
        } else {
            PyObject* empty = PyTuple_New(0);
            PyObject* fields = Py_BuildValue("{sOsO}", "name", name, "origin", origin);
            PyObject* trusted = (empty && fields) ? PyObject_Call(spec_type_, empty, fields) : NULL;
            if (trusted != NULL) {
                result = file != NULL
                    ? PyObject_CallFunctionObjArgs(original, trusted, file, NULL)
                    : PyObject_CallOneArg(original, trusted);
            }
            Py_XDECREF(trusted);
            Py_XDECREF(fields);
            Py_XDECREF(empty);
        }
    }

    Py_DECREF(origin);
    Py_DECREF(name);
    return result;
}

bool GuestRuntime::allowed_while_importing(const std::string& event, PyObject* args) const {
    if (import_depth_ == 0 || guest_frame_active()) return false;
    if (event == "open") return is_read_only_open(args);
    for (int i = 0; IMPORT_OPERATIONS[i] != NULL; ++i) {
        if (event == IMPORT_OPERATIONS[i]) return true;
    }
    return false;
}

int GuestRuntime::audit(const char* event, PyObject* args) {
    if (phase_ == GuestPhase::SETUP) return 0;

    std::string name(event);

    // Loads that bypassed __import__ (C callers, importlib internals)
    if (name == "import") {
        if (import_depth_ > 0 && !guest_frame_active()) return 0;
        if (!PyTuple_Check(args) || PyTuple_GET_SIZE(args) < 1) return 0;
        std::string module = utf8_of(PyTuple_GET_ITEM(args, 0));
        if (policy_.is_module_allowed(module)) return 0;
        return deny(CapabilityError::MODULE_DENIED, module);
    }

    if (!policy_.is_operation_denied(name)) return 0;

    // The guest's own top-level code object, once
    if (name == "exec" && !guest_code_started_ && PyTuple_Check(args) &&
        PyTuple_GET_SIZE(args) > 0 && PyTuple_GET_ITEM(args, 0) == guest_code_) {
        guest_code_started_ = true;
        return 0;
    }

    if (allowed_while_importing(name, args)) return 0;

    return deny(CapabilityError::OPERATION_DENIED, name);
}

} // namespace worker
} // namespace scriptcell

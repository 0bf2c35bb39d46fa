#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <atomic>
#include <chrono>
#include <future>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "planner.hpp"

static PyStructSequence_Field slotplanner_assignment_fields[] = {
    {"child_id", "ID of the child"},
    {"teacher_id", "ID of the teacher"},
    {"day", "Day on which the session takes place"},
    {"from_hour", "Hour at which the session starts"},
    {"from_minute", "Minute at which the session starts"},
    {"to_hour", "Hour at which the session ends"},
    {"to_minute", "Minute at which the session ends"},
    {nullptr}
};

static PyStructSequence_Desc slotplanner_assignment_desc = {
    "slotplanner.assignment",
    "one child's weekly session",
    slotplanner_assignment_fields,
    7
};

static PyStructSequence_Field slotplanner_violation_fields[] = {
    {"kind", "which goal is unmet"},
    {"subjects", "IDs of the children or teachers concerned"},
    {"detail", "human readable description"},
    {nullptr}
};

static PyStructSequence_Desc slotplanner_violation_desc = {
    "slotplanner.violation",
    "an unmet goal of a plan",
    slotplanner_violation_fields,
    3
};

static PyStructSequence_Field slotplanner_change_fields[] = {
    {"child_id", "ID of the child"},
    {"kind", "unchanged, changed, added or removed"},
    {"old", "previous assignment or None"},
    {"new", "current assignment or None"},
    {nullptr}
};

static PyStructSequence_Desc slotplanner_change_desc = {
    "slotplanner.change",
    "difference of one child's assignment between two plans",
    slotplanner_change_fields,
    4
};

static PyStructSequence_Field slotplanner_plan_fields[] = {
    {"schedule", "list of assignments"},
    {"unassigned", "IDs of the children without a session"},
    {"status", "OPTIMAL, FEASIBLE or NO_SOLUTION"},
    {"runtime_ms", "wall clock time of the solve"},
    {"score", "achieved weighted score"},
    {"violations", "list of unmet goals"},
    {"diff", "list of changes against the previous plan"},
    {"warnings", "non-fatal input problems"},
    {nullptr}
};

static PyStructSequence_Desc slotplanner_plan_desc = {
    "slotplanner.plan",
    "result of a solve",
    slotplanner_plan_fields,
    8
};

static PyTypeObject* assignment_type = nullptr;
static PyTypeObject* violation_type = nullptr;
static PyTypeObject* change_type = nullptr;
static PyTypeObject* plan_type = nullptr;

struct PyObjectGuard {
    PyObjectGuard() {}
    PyObjectGuard(PyObject* obj) : obj{obj} {}
    PyObjectGuard(const PyObjectGuard&) = delete;
    PyObjectGuard& operator=(const PyObjectGuard&) = delete;
    ~PyObjectGuard() { Py_XDECREF(obj); }
    operator PyObject*() { return obj; }
    // hands the reference over to the caller
    PyObject* release() { PyObject* ret = obj; obj = nullptr; return ret; }
    PyObject* obj = nullptr;
};

// lets other Python threads run while the solver works
struct GilRelease {
    GilRelease() : state{PyEval_SaveThread()} {}
    GilRelease(const GilRelease&) = delete;
    GilRelease& operator=(const GilRelease&) = delete;
    ~GilRelease() { PyEval_RestoreThread(state); }
    PyThreadState* state;
};

static long long getattr_long_long(PyObject* obj, const char* attr) {
    PyObjectGuard obj_attr = PyObject_GetAttrString(obj, attr);
    if (!obj_attr)
        throw validation_error(fmt::format("attribute '{}' does not exist", attr));
    const auto value = PyLong_AsLongLong(obj_attr);
    if (value == -1 && PyErr_Occurred())
        throw validation_error(fmt::format("attribute {} was not a long integer", attr));
    return value;
}

static unsigned getattr_unsigned(PyObject* obj, const char* attr) {
    const auto value = getattr_long_long(obj, attr);
    if (value < 0 || value > std::numeric_limits<unsigned>::max())
        throw validation_error(fmt::format("attribute {} is out of range: {}", attr, value));
    return unsigned(value);
}

static std::string as_string(PyObject* obj, const char* what) {
    PyObjectGuard py_obj_unicode = PyObject_Str(obj);
    if (!py_obj_unicode)
        throw validation_error(fmt::format("{} cannot be converted to unicode", what));
    PyObjectGuard py_obj_utf8 = PyUnicode_AsUTF8String(py_obj_unicode);
    if (!py_obj_utf8)
        throw validation_error(fmt::format("{} cannot be converted to UTF-8 string", what));

    return PyBytes_AsString(py_obj_utf8);
}

static std::string getattr_string(PyObject* obj, const char* attr) {
    PyObjectGuard obj_attr = PyObject_GetAttrString(obj, attr);
    if (!obj_attr)
        throw validation_error(fmt::format("attribute '{}' does not exist", attr));
    return as_string(obj_attr, fmt::format("attribute '{}'", attr).c_str());
}

// missing or None attributes yield nullopt
static std::optional<std::string> getattr_optional_string(PyObject* obj, const char* attr) {
    if (!PyObject_HasAttrString(obj, attr))
        return std::nullopt;
    PyObjectGuard obj_attr = PyObject_GetAttrString(obj, attr);
    if (!obj_attr || obj_attr.obj == Py_None)
        return std::nullopt;
    return as_string(obj_attr, fmt::format("attribute '{}'", attr).c_str());
}

static bool getattr_bool(PyObject* obj, const char* attr, bool fallback) {
    if (!PyObject_HasAttrString(obj, attr))
        return fallback;
    PyObjectGuard obj_attr = PyObject_GetAttrString(obj, attr);
    const int value = obj_attr ? PyObject_IsTrue(obj_attr) : -1;
    if (value < 0)
        throw validation_error(fmt::format("attribute '{}' is not a truth value", attr));
    return value;
}

static PyObject* getattr_list(PyObject* obj, const char* attr) {
    PyObject* obj_attr = PyObject_GetAttrString(obj, attr); // New reference
    if (!obj_attr)
        throw validation_error(fmt::format("attribute '{}' does not exist", attr));
    if (!PyList_Check(obj_attr)) {
        Py_DecRef(obj_attr);
        throw validation_error(fmt::format("attribute '{}' is not a list", attr));
    }
    return obj_attr;
}

static std::vector<std::string> read_string_list(PyObject* py_list, const char* what) {
    std::vector<std::string> result;
    const auto count = PyList_Size(py_list);
    for (Py_ssize_t index{0}; index < count; ++index)
        result.push_back(as_string(PyList_GetItem(py_list, index), what)); // Borrowed reference
    return result;
}

static void read_availabilities(Participant& participant, PyObject* py_obj) {
    PyObjectGuard py_obj_availabilities = getattr_list(py_obj, "availabilities");
    const auto availabilities_count = PyList_Size(py_obj_availabilities);
    for (Py_ssize_t availabilities_index{0}; availabilities_index < availabilities_count; ++availabilities_index) {
        PyObject* py_obj_availability = PyList_GetItem(py_obj_availabilities, availabilities_index); // Borrowed reference
        const auto day         = parse_day(getattr_string(py_obj_availability, "day"));
        const auto from_hour   = getattr_unsigned(py_obj_availability, "from_hour");
        const auto from_minute = getattr_unsigned(py_obj_availability, "from_minute");
        const auto to_hour     = getattr_unsigned(py_obj_availability, "to_hour");
        const auto to_minute   = getattr_unsigned(py_obj_availability, "to_minute");
        participant.add_availability(TimeSlot(day, from_hour, from_minute), TimeSlot(day, to_hour, to_minute));
    }
}

static std::vector<Teacher> read_teacher_config(PyObject* py_list_teachers) {
    const auto teachers_count = PyList_Size(py_list_teachers);
    std::vector<Teacher> teachers;
    teachers.reserve(teachers_count);

    for (Py_ssize_t teachers_index{0}; teachers_index < teachers_count; ++teachers_index) {
        PyObject* py_obj_teacher = PyList_GetItem(py_list_teachers, teachers_index); // Borrowed reference
        if (!py_obj_teacher)
            throw validation_error("could not retrieve teacher from list");

        Teacher teacher(getattr_string(py_obj_teacher, "id"), getattr_string(py_obj_teacher, "name"));
        read_availabilities(teacher, py_obj_teacher);
        teachers.push_back(teacher);
    }

    return teachers;
}

static std::vector<Child> read_child_config(PyObject* py_list_children) {
    const auto children_count = PyList_Size(py_list_children);
    std::vector<Child> children;
    children.reserve(children_count);

    for (Py_ssize_t children_index{0}; children_index < children_count; ++children_index) {
        PyObject* py_obj_child = PyList_GetItem(py_list_children, children_index); // Borrowed reference
        if (!py_obj_child)
            throw validation_error("could not retrieve child from list");

        std::vector<std::string> preferred_teachers;
        if (PyObject_HasAttrString(py_obj_child, "preferred_teachers")) {
            PyObjectGuard py_list_preferred = getattr_list(py_obj_child, "preferred_teachers");
            preferred_teachers = read_string_list(py_list_preferred, "preferred teacher");
        }

        Child child(getattr_string(py_obj_child, "id"),
                    getattr_string(py_obj_child, "name"),
                    preferred_teachers,
                    getattr_bool(py_obj_child, "early_preferred", false));
        read_availabilities(child, py_obj_child);
        children.push_back(child);
    }

    return children;
}

static std::vector<Tandem> read_tandem_config(PyObject* py_list_tandems) {
    const auto tandems_count = PyList_Size(py_list_tandems);
    std::vector<Tandem> tandems;
    tandems.reserve(tandems_count);

    for (Py_ssize_t tandems_index{0}; tandems_index < tandems_count; ++tandems_index) {
        PyObject* py_obj_tandem = PyList_GetItem(py_list_tandems, tandems_index); // Borrowed reference
        if (!py_obj_tandem)
            throw validation_error("could not retrieve tandem from list");

        const auto child1 = getattr_string(py_obj_tandem, "child1");
        const auto child2 = getattr_string(py_obj_tandem, "child2");
        const long long priority = PyObject_HasAttrString(py_obj_tandem, "priority")
            ? getattr_long_long(py_obj_tandem, "priority")
            : default_tandem_priority;
        tandems.emplace_back(child1, child2,
                             getattr_optional_string(py_obj_tandem, "preferred_teacher"),
                             checked_tandem_priority(priority, child1, child2));
    }

    return tandems;
}

static weight_config read_weight_config(PyObject* py_dict_weights) {
    auto weights = default_weights();
    if (!py_dict_weights || py_dict_weights == Py_None)
        return weights;

    const std::pair<const char*, double*> named[] = {
        {"preferred_teacher", &weights.preferred_teacher},
        {"priority_early_slot", &weights.priority_early_slot},
        {"tandem_fulfilled", &weights.tandem_fulfilled},
        {"teacher_pause_respected", &weights.teacher_pause_respected},
        {"preserve_existing_plan", &weights.preserve_existing_plan},
    };
    for (const auto& [name, target] : named) {
        PyObject* py_obj_value = PyDict_GetItemString(py_dict_weights, name); // Borrowed reference
        if (!py_obj_value)
            continue;
        const double value = PyFloat_AsDouble(py_obj_value);
        if (value == -1.0 && PyErr_Occurred())
            throw validation_error(fmt::format("weight '{}' is not a number", name));
        *target = value;
    }
    return weights;
}

static assignment_map read_assignments(PyObject* py_list_assignments) {
    assignment_map assignments;
    const auto count = PyList_Size(py_list_assignments);
    for (Py_ssize_t index{0}; index < count; ++index) {
        PyObject* py_obj_assignment = PyList_GetItem(py_list_assignments, index); // Borrowed reference
        const auto day = parse_day(getattr_string(py_obj_assignment, "day"));
        const TimeSlot start(day, getattr_unsigned(py_obj_assignment, "from_hour"), getattr_unsigned(py_obj_assignment, "from_minute"));
        assignments.insert_or_assign(getattr_string(py_obj_assignment, "child_id"),
                                     assignment{getattr_string(py_obj_assignment, "teacher_id"), start});
    }
    return assignments;
}

static PyObject* export_string_list(const std::vector<std::string>& strings) {
    PyObject* result_list = PyList_New(strings.size());
    Py_ssize_t result_list_index{0};
    for (const auto& s : strings)
        PyList_SetItem(result_list, result_list_index++, PyUnicode_FromString(s.c_str()));
    return result_list;
}

static PyObject* export_assignment(const std::string& child_id, const assignment& a) {
    PyObject* result_tuple = PyStructSequence_New(assignment_type);
    const auto end = a.start.session_end();
    PyStructSequence_SetItem(result_tuple, 0, PyUnicode_FromString(child_id.c_str()));
    PyStructSequence_SetItem(result_tuple, 1, PyUnicode_FromString(a.teacher_id.c_str()));
    PyStructSequence_SetItem(result_tuple, 2, PyUnicode_FromString(fmt::format("{:d}", a.start).c_str()));
    PyStructSequence_SetItem(result_tuple, 3, PyLong_FromUnsignedLong(a.start.get_hour()));
    PyStructSequence_SetItem(result_tuple, 4, PyLong_FromUnsignedLong(a.start.get_minute()));
    PyStructSequence_SetItem(result_tuple, 5, PyLong_FromUnsignedLong(end.get_hour()));
    PyStructSequence_SetItem(result_tuple, 6, PyLong_FromUnsignedLong(end.get_minute()));
    return result_tuple;
}

static PyObject* export_optional_assignment(const std::string& child_id, const std::optional<assignment>& a) {
    if (!a)
        Py_RETURN_NONE;
    return export_assignment(child_id, *a);
}

static PyObject* export_violations(const std::vector<violation>& violations) {
    PyObject* result_list = PyList_New(violations.size());
    Py_ssize_t result_list_index{0};
    for (const auto& v : violations) {
        PyObject* result_tuple = PyStructSequence_New(violation_type);
        PyStructSequence_SetItem(result_tuple, 0, PyUnicode_FromString(fmt::format("{}", v.kind).c_str()));
        PyStructSequence_SetItem(result_tuple, 1, export_string_list(v.subjects));
        PyStructSequence_SetItem(result_tuple, 2, PyUnicode_FromString(v.detail.c_str()));
        PyList_SetItem(result_list, result_list_index++, result_tuple);
    }
    return result_list;
}

static PyObject* export_changes(const std::vector<diff_entry>& changes) {
    PyObject* result_list = PyList_New(changes.size());
    Py_ssize_t result_list_index{0};
    for (const auto& entry : changes) {
        PyObject* result_tuple = PyStructSequence_New(change_type);
        PyStructSequence_SetItem(result_tuple, 0, PyUnicode_FromString(entry.child_id.c_str()));
        PyStructSequence_SetItem(result_tuple, 1, PyUnicode_FromString(fmt::format("{}", entry.kind).c_str()));
        PyStructSequence_SetItem(result_tuple, 2, export_optional_assignment(entry.child_id, entry.old_assignment));
        PyStructSequence_SetItem(result_tuple, 3, export_optional_assignment(entry.child_id, entry.new_assignment));
        PyList_SetItem(result_list, result_list_index++, result_tuple);
    }
    return result_list;
}

static PyObject* export_plan(const Plan& plan, const std::vector<Child>& children) {
    PyObject* schedule_list = PyList_New(plan.assignments.size());
    Py_ssize_t schedule_list_index{0};
    for (const auto& [child_id, a] : plan.assignments)
        PyList_SetItem(schedule_list, schedule_list_index++, export_assignment(child_id, a));

    std::vector<std::string> unassigned;
    for (const auto& child : children)
        if (!plan.is_assigned(child.get_id()))
            unassigned.push_back(child.get_id());

    PyObject* result_tuple = PyStructSequence_New(plan_type);
    PyStructSequence_SetItem(result_tuple, 0, schedule_list);
    PyStructSequence_SetItem(result_tuple, 1, export_string_list(unassigned));
    PyStructSequence_SetItem(result_tuple, 2, PyUnicode_FromString(fmt::format("{}", plan.status).c_str()));
    PyStructSequence_SetItem(result_tuple, 3, PyLong_FromLongLong(plan.runtime.count()));
    PyStructSequence_SetItem(result_tuple, 4, PyFloat_FromDouble(plan.score.total()));
    PyStructSequence_SetItem(result_tuple, 5, export_violations(plan.violations));
    PyStructSequence_SetItem(result_tuple, 6, export_changes(plan.changes));
    PyStructSequence_SetItem(result_tuple, 7, export_string_list(plan.warnings));
    return result_tuple;
}

// the Python side of a running solve; only touched with the GIL held
struct PythonSolveHooks {
    PythonSolveHooks(PyObject* cancel, PyObject* progress) : cancel{cancel}, progress{progress} {}
    PythonSolveHooks(const PythonSolveHooks&) = delete;
    PythonSolveHooks& operator=(const PythonSolveHooks&) = delete;
    ~PythonSolveHooks() {
        Py_XDECREF(error_type);
        Py_XDECREF(error_value);
        Py_XDECREF(error_traceback);
    }

    // called from solver threads
    void report(const search_progress& p) {
        PyGILState_STATE gil = PyGILState_Ensure();
        if (progress != Py_None && !stop) {
            PyObjectGuard result = PyObject_CallFunction(progress, "dId", p.elapsed_seconds, p.assigned, p.score);
            if (!result)
                keep_error();
            else if (result.obj == Py_False)
                stop = true;
        }
        PyGILState_Release(gil);
    }

    // called from the thread that entered solve()
    void poll() {
        if (stop)
            return;
        if (PyErr_CheckSignals() < 0) {
            keep_error();
            return;
        }
        if (cancel == Py_None)
            return;
        PyObjectGuard is_set = PyObject_CallMethod(cancel, "is_set", nullptr);
        const int value = is_set ? PyObject_IsTrue(is_set) : -1;
        if (value < 0)
            keep_error();
        else if (value)
            stop = true;
    }

    // the first exception raised while searching stops the search and is raised after it
    void keep_error() {
        if (!error_type)
            PyErr_Fetch(&error_type, &error_value, &error_traceback);
        else
            PyErr_Clear();
        stop = true;
    }

    bool restore_error() {
        if (!error_type)
            return false;
        PyErr_Restore(error_type, error_value, error_traceback);
        error_type = error_value = error_traceback = nullptr;
        return true;
    }

    PyObject* cancel;
    PyObject* progress;
    std::atomic<bool> stop{false};
    PyObject* error_type = nullptr;
    PyObject* error_value = nullptr;
    PyObject* error_traceback = nullptr;
};

static constexpr std::chrono::milliseconds poll_interval{100};

// translates engine exceptions into Python exceptions
template <typename Function>
static PyObject* guarded(Function&& function) {
    try {
        return function();
    } catch (validation_error& ex) {
        PyErr_SetString(PyExc_ValueError, ex.what());
    } catch (solver_fault& ex) {
        PyErr_SetString(PyExc_RuntimeError, ex.what());
    } catch (std::exception& ex) {
        PyErr_SetString(PyExc_RuntimeError, ex.what());
    }
    return nullptr;
}

static PyObject* slotplanner_solve(PyObject* self, PyObject* args, PyObject* keywds) {
    static const char* kwlist[] = {
        "children",
        "teachers",
        "tandems",
        "weights",
        "previous_plan",
        "time_limit",
        "num_workers",
        "seed",
        "cancel",
        "progress",
        nullptr
    };
    PyObject* py_list_children;
    PyObject* py_list_teachers;
    PyObject* py_list_tandems;
    PyObject* py_dict_weights = Py_None;
    PyObject* py_list_previous = Py_None;
    PyObject* py_obj_cancel = Py_None;
    PyObject* py_obj_progress = Py_None;
    auto cfg = default_solve_config();

    if (!PyArg_ParseTupleAndKeywords(args, keywds, "O!O!O!|OOdIIOO", (char**) kwlist,
        &PyList_Type, &py_list_children,
        &PyList_Type, &py_list_teachers,
        &PyList_Type, &py_list_tandems,
        &py_dict_weights,
        &py_list_previous,
        &cfg.time_limit_seconds,
        &cfg.num_workers,
        &cfg.random_seed,
        &py_obj_cancel,
        &py_obj_progress))
        return nullptr;

    if (py_dict_weights != Py_None && !PyDict_Check(py_dict_weights)) {
        PyErr_SetString(PyExc_TypeError, "weights must be a dict");
        return nullptr;
    }
    if (py_list_previous != Py_None && !PyList_Check(py_list_previous)) {
        PyErr_SetString(PyExc_TypeError, "previous_plan must be a list");
        return nullptr;
    }
    if (py_obj_progress != Py_None && !PyCallable_Check(py_obj_progress)) {
        PyErr_SetString(PyExc_TypeError, "progress must be callable");
        return nullptr;
    }

    return guarded([&]() {
        const auto children = read_child_config(py_list_children);
        const auto teachers = read_teacher_config(py_list_teachers);
        const auto tandems = read_tandem_config(py_list_tandems);
        const auto weights = read_weight_config(py_dict_weights);
        std::optional<PreviousPlan> previous;
        if (py_list_previous != Py_None)
            previous = PreviousPlan(read_assignments(py_list_previous));

        const Planner planner(cfg);
        PythonSolveHooks hooks(py_obj_cancel, py_obj_progress);
        auto pending = planner.solve_async(children, teachers, tandems, weights, previous, std::nullopt, {
            .cancel = &hooks.stop,
            .on_progress = [&hooks](const search_progress& p) { hooks.report(p); },
        });
        for (;;) {
            {
                GilRelease nogil;
                if (pending.wait_for(poll_interval) == std::future_status::ready)
                    break;
            }
            hooks.poll();
        }

        const Plan plan = pending.get();
        if (hooks.restore_error())
            return (PyObject*) nullptr;
        return export_plan(plan, children);
    });
}

static PyObject* slotplanner_explain(PyObject* self, PyObject* args) {
    PyObject* py_list_schedule;
    PyObject* py_list_children;
    PyObject* py_list_teachers;
    PyObject* py_list_tandems;

    if (!PyArg_ParseTuple(args, "O!O!O!O!",
        &PyList_Type, &py_list_schedule,
        &PyList_Type, &py_list_children,
        &PyList_Type, &py_list_teachers,
        &PyList_Type, &py_list_tandems))
        return nullptr;

    return guarded([&]() {
        Plan plan{};
        plan.assignments = read_assignments(py_list_schedule);
        const Planner planner;
        return export_violations(planner.explain(plan,
            read_child_config(py_list_children),
            read_teacher_config(py_list_teachers),
            read_tandem_config(py_list_tandems)));
    });
}

static PyObject* slotplanner_diff(PyObject* self, PyObject* args) {
    PyObject* py_list_schedule;
    PyObject* py_list_previous;

    if (!PyArg_ParseTuple(args, "O!O!",
        &PyList_Type, &py_list_schedule,
        &PyList_Type, &py_list_previous))
        return nullptr;

    return guarded([&]() {
        Plan plan{};
        plan.assignments = read_assignments(py_list_schedule);
        return export_changes(Planner::diff(plan, PreviousPlan(read_assignments(py_list_previous))));
    });
}

static PyMethodDef SlotPlannerMethods[] = {
    {"solve", (PyCFunction) slotplanner_solve, METH_VARARGS | METH_KEYWORDS, "provide an optimal weekly session plan for the given children and teachers; cancel is polled through is_set(), progress(elapsed, assigned, score) stops the search by returning False"},
    {"explain", (PyCFunction) slotplanner_explain, METH_VARARGS, "list the goals a schedule leaves unmet"},
    {"diff", (PyCFunction) slotplanner_diff, METH_VARARGS, "compare a schedule against a previous one"},
    {nullptr}
};

static struct PyModuleDef SlotPlannerModule = {
    .m_base = PyModuleDef_HEAD_INIT,
    .m_name = "slotplanner",
    .m_doc = "Weekly session planning for children and teachers",
    .m_size = -1,
    .m_methods = SlotPlannerMethods
};

static PyObject* slotplanner_module = nullptr;

static bool add_type(PyObject* module, const char* name, PyTypeObject*& type, PyStructSequence_Desc* desc) {
    if (!type)
        type = PyStructSequence_NewType(desc);
    if (!type)
        return false;
    Py_INCREF(type);
    if (PyModule_AddObject(module, name, (PyObject *) type) < 0) {
        Py_DECREF(type);
        return false;
    }
    return true;
}

PyMODINIT_FUNC
PyInit_slotplanner(void) {
    if (!slotplanner_module)
        slotplanner_module = PyModule_Create(&SlotPlannerModule);
    if (!slotplanner_module)
        return nullptr;

    if (!add_type(slotplanner_module, "assignment", assignment_type, &slotplanner_assignment_desc) ||
        !add_type(slotplanner_module, "violation", violation_type, &slotplanner_violation_desc) ||
        !add_type(slotplanner_module, "change", change_type, &slotplanner_change_desc) ||
        !add_type(slotplanner_module, "plan", plan_type, &slotplanner_plan_desc))
        return nullptr;

    return slotplanner_module;
}

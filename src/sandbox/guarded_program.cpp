#include "sandbox/guarded_program.h"
#include "infrastructure/error_handling.h"
#include <sstream>

namespace quantbox {
namespace sandbox {

std::string pythonStringLiteral(const std::string& text) {
    // A JSON string is a valid Python literal: every escape it emits
    // (\" \\ \b \f \n \r \t \uXXXX) has the same meaning in Python.
    return engine::Value(text).dump(-1, ' ', false, engine::Value::error_handler_t::replace);
}

static std::string pythonStringList(const std::set<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) oss << ", ";
        oss << pythonStringLiteral(item);
        first = false;
    }
    oss << "]";
    return oss.str();
}

std::string composeGuardedProgram(const IsolationPolicy& policy,
                                  const std::string& script,
                                  const engine::Value& context,
                                  const std::string& enginePath) {
    if (!context.is_object()) {
        throw QuantboxError(ErrorCode::SETUP_FAILED,
                            std::string("Context must be a JSON object, got ") + engine::typeName(context));
    }
    std::string where;
    if (!engine::isRepresentable(context, &where)) {
        throw QuantboxError(ErrorCode::SETUP_FAILED, "Context is not JSON representable: " + where);
    }

    // ASCII-only JSON text, then quoted again so it survives as a plain literal.
    std::string contextJson = context.dump(-1, ' ', true, engine::Value::error_handler_t::replace);

    std::ostringstream p;
    p << "def _quantbox_main():\n";
    p << "    import builtins\n";
    p << "    import json\n";
    p << "    import sys\n";
    p << "\n";
    p << "    engine_path = " << pythonStringLiteral(enginePath) << "\n";
    p << "    if engine_path:\n";
    p << "        sys.path.insert(0, engine_path)\n";
    p << "\n";
    p << "    script_globals = {\"__name__\": \"__main__\", \"__builtins__\": builtins}\n";
    p << "\n";

    // Import guard. The caller-supplied globals are never trusted. An import
    // is admitted when its top-level name is allowed, when it runs while an
    // admitted import is still executing (module bodies of allowed modules),
    // or when the calling frame is code of an allowed module loaded from a
    // file (lazy imports inside library functions). Code compiled by the
    // script carries a "<...>" filename and is always checked.
    p << "    allowed = frozenset(" << pythonStringList(policy.allowedImports) << ")\n";
    p << "    allowed_text = \", \".join(sorted(allowed))\n";
    p << "    original_import = builtins.__import__\n";
    p << "    admitted_depth = [0]\n";
    p << "\n";
    p << "    class ImportDenied(ImportError):\n";
    p << "        pass\n";
    p << "\n";
    p << "    def called_from_allowed_module(frame):\n";
    p << "        if frame is None:\n";
    p << "            return False\n";
    p << "        module_name = frame.f_globals.get(\"__name__\")\n";
    p << "        if not isinstance(module_name, str) or module_name == \"__main__\":\n";
    p << "            return False\n";
    p << "        if module_name.partition(\".\")[0] not in allowed:\n";
    p << "            return False\n";
    p << "        module = sys.modules.get(module_name)\n";
    p << "        if module is None or getattr(module, \"__dict__\", None) is not frame.f_globals:\n";
    p << "            return False\n";
    p << "        return not frame.f_code.co_filename.startswith(\"<\")\n";
    p << "\n";
    p << "    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):\n";
    p << "        if admitted_depth[0] == 0 and not called_from_allowed_module(sys._getframe(1)):\n";
    p << "            if level != 0:\n";
    p << "                raise ImportDenied(\"Relative imports are not allowed\")\n";
    p << "            if not isinstance(name, str) or name.partition(\".\")[0] not in allowed:\n";
    p << "                raise ImportDenied(\"Module '%s' is not allowed. Allowed: %s\" % (name, allowed_text))\n";
    p << "        admitted_depth[0] += 1\n";
    p << "        try:\n";
    p << "            return original_import(name, globals, locals, fromlist, level)\n";
    p << "        finally:\n";
    p << "            admitted_depth[0] -= 1\n";
    p << "\n";
    p << "    builtins.__import__ = guarded_import\n";
    p << "\n";

    if (!policy.allowFileRead) {
        p << "    def denied_open(*args, **kwargs):\n";
        p << "        raise PermissionError(\"File access is disabled by the sandbox policy\")\n";
        p << "\n";
        p << "    script_globals[\"open\"] = denied_open\n";
        p << "\n";
    }

    p << "    context = json.loads(" << pythonStringLiteral(contextJson) << ")\n";
    p << "    script_globals[\"context\"] = context\n";
    p << "    script_globals.update(context)\n";
    p << "\n";

    p << "    def report_failure(message, error_type):\n";
    p << "        sys.stdout.write(json.dumps({\"success\": False, \"error\": message, \"error_type\": error_type}) + \"\\n\")\n";
    p << "        sys.stdout.flush()\n";
    p << "\n";
    p << "    source = " << pythonStringLiteral(script) << "\n";
    p << "    try:\n";
    p << "        exec(compile(source, \"<script>\", \"exec\"), script_globals)\n";
    p << "    except BaseException as e:\n";
    p << "        try:\n";
    p << "            message = str(e)\n";
    p << "        except Exception:\n";
    p << "            message = repr(type(e))\n";
    p << "        report_failure(message, type(e).__name__)\n";
    p << "        return " << EXIT_SCRIPT_FAILED << "\n";
    p << "\n";

    // Objects from quantbox_safe serialize through their to_json() method.
    p << "    def encode_default(obj):\n";
    p << "        to_json = getattr(obj, \"to_json\", None)\n";
    p << "        if callable(to_json):\n";
    p << "            return to_json()\n";
    p << "        raise TypeError(\"Object of type %s is not JSON serializable\" % type(obj).__name__)\n";
    p << "\n";
    p << "    if \"result\" in script_globals:\n";
    p << "        result = script_globals[\"result\"]\n";
    p << "    else:\n";
    p << "        result = {\"success\": True, \"executed\": True}\n";
    p << "    try:\n";
    p << "        text = json.dumps(result, allow_nan=False, default=encode_default)\n";
    p << "    except BaseException as e:\n";
    p << "        report_failure(\"Code did not return JSON-serializable output: %s\" % e, \"OutputContractError\")\n";
    p << "        return " << EXIT_OUTPUT_CONTRACT << "\n";
    p << "    sys.stdout.write(text + \"\\n\")\n";
    p << "    sys.stdout.flush()\n";
    p << "    return 0\n";
    p << "\n";
    p << "\n";
    p << "raise SystemExit(_quantbox_main())\n";

    return p.str();
}

}
}

#include "harness/harness_builder.hpp"

#include "protocol/execution_contract.hpp"

namespace scriptbox::harness {

namespace {

constexpr std::string_view kPreamble =
    "# coding: utf-8\n"
    "import json, sys\n"
    "# --- user script ---\n";

// The driver imports private aliases so a script that rebinds `json` or `sys`
// cannot break result reporting.
constexpr std::string_view kDriverHead =
    "\n"
    "\n"
    "# --- runner ---\n"
    "def __scriptbox_run_and_emit_result():\n"
    "    import json as _json\n"
    "    import sys as _sys\n"
    "    marker = \"";

constexpr std::string_view kDriverTail =
    "\"\n"
    "\n"
    "    # Always starts on a fresh line, so output printed with end=\"\" cannot\n"
    "    # glue onto the marker. The normalizer drops the one empty line this adds.\n"
    "    def emit(text):\n"
    "        _sys.stdout.write(\"\\n\" + marker + text + \"\\n\")\n"
    "        _sys.stdout.flush()\n"
    "\n"
    "    try:\n"
    "        result = main()\n"
    "    except Exception:\n"
    "        import traceback\n"
    "        traceback.print_exc(file=_sys.stderr)\n"
    "        _sys.exit(1)\n"
    "\n"
    "    try:\n"
    "        payload = _json.dumps(result, allow_nan=False)\n"
    "    except (TypeError, ValueError, RecursionError) as e:\n"
    "        emit(_json.dumps({\"__error__\": str(e)}))\n"
    "        _sys.exit(2)\n"
    "\n"
    "    emit(payload)\n"
    "\n"
    "if __name__ == \"__main__\":\n"
    "    __scriptbox_run_and_emit_result()\n";

}  // namespace

std::string build_harness(std::string_view script) {
    std::string source;
    source.reserve(kPreamble.size() + script.size() + kDriverHead.size() +
                   protocol::kResultMarker.size() + kDriverTail.size());
    source.append(kPreamble);
    source.append(script);
    source.append(kDriverHead);
    source.append(protocol::kResultMarker);
    source.append(kDriverTail);
    return source;
}

}  // namespace scriptbox::harness

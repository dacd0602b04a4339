/**
 * @file bootstrap_encoder.cpp
 * @brief Bootstrap script generation and the headless turtle module
 *
 * @date 2025
 */

#include "coderunner/core/bootstrap_encoder.hpp"
#include "coderunner/core/errors.hpp"
#include "coderunner/utils/encoding_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace coderunner {
namespace core {

using utils::EncodingUtils;

namespace {

constexpr std::size_t kSentinelRandomBytes = 32;

// ============================================================================
// TURTLE STAND-IN
// ============================================================================
// Drawing calls record line segments; done()/mainloop()/exitonclick() and
// interpreter exit render them to turtle.svg in the working directory.

const char* const kTurtleSource = R"PY("""Headless turtle: records line segments and renders turtle.svg."""
import atexit as _atexit
import math as _math
import os as _os

_WIDTH = 500
_HEIGHT = 500
_DIR = _os.getcwd()
_OUT = 'turtle.svg'

_segments = []
_turtles = []
_state = {'bg': '#ffffff', 'written': -1}


def _colorstr(args):
    if len(args) == 1 and isinstance(args[0], (tuple, list)):
        args = tuple(args[0])
    if len(args) == 3 and all(isinstance(v, (int, float)) for v in args):
        scale = 255.0 if all(v <= 1.0 for v in args) else 1.0
        return 'rgb(%d,%d,%d)' % tuple(int(round(v * scale)) for v in args)
    return str(args[0])


def _esc(text):
    return (text.replace('&', '&amp;').replace('<', '&lt;')
            .replace('>', '&gt;').replace('"', '&quot;'))


class Turtle(object):
    def __init__(self, *args, **kwargs):
        self._x = 0.0
        self._y = 0.0
        self._heading = 0.0
        self._down = True
        self._color = '#1f6feb'
        self._width = 2
        _turtles.append(self)

    def _move(self, x, y):
        x, y = float(x), float(y)
        if self._down:
            _segments.append((self._x, self._y, x, y, self._color, self._width))
        self._x, self._y = x, y

    def forward(self, distance):
        rad = _math.radians(self._heading)
        self._move(self._x + _math.cos(rad) * distance, self._y + _math.sin(rad) * distance)
    fd = forward

    def backward(self, distance):
        self.forward(-distance)
    back = bk = backward

    def left(self, angle):
        self._heading = (self._heading + angle) % 360
    lt = left

    def right(self, angle):
        self.left(-angle)
    rt = right

    def penup(self):
        self._down = False
    pu = up = penup

    def pendown(self):
        self._down = True
    pd = down = pendown

    def isdown(self):
        return self._down

    def goto(self, x, y=None):
        if y is None:
            x, y = x
        self._move(x, y)
    setpos = setposition = goto

    def setx(self, x):
        self._move(x, self._y)

    def sety(self, y):
        self._move(self._x, y)

    def setheading(self, angle):
        self._heading = float(angle) % 360
    seth = setheading

    def heading(self):
        return self._heading

    def position(self):
        return (self._x, self._y)
    pos = position

    def xcor(self):
        return self._x

    def ycor(self):
        return self._y

    def home(self):
        self._move(0.0, 0.0)
        self._heading = 0.0

    def color(self, *args):
        if args:
            self._color = _colorstr(args)
        return self._color
    pencolor = color

    def pensize(self, width=None):
        if width is not None:
            self._width = max(1, int(width))
        return self._width
    width = pensize

    def circle(self, radius, extent=360, steps=None):
        if steps is None:
            steps = max(4, int(abs(extent) / 10))
        step = float(extent) / steps
        if radius < 0:
            step = -step
        chord = 2.0 * abs(radius) * _math.sin(_math.radians(abs(step)) / 2.0)
        self.left(step / 2.0)
        for _ in range(steps):
            self.forward(chord)
            self.left(step)
        self.left(-step / 2.0)

    def _noop(self, *args, **kwargs):
        return None
    speed = shape = shapesize = fillcolor = begin_fill = end_fill = _noop
    hideturtle = ht = showturtle = st = dot = stamp = write = clear = _noop


class _Screen(object):
    def bgcolor(self, *args):
        if args:
            _state['bg'] = _colorstr(args)
        return _state['bg']

    def _noop(self, *args, **kwargs):
        return None
    setup = title = tracer = update = screensize = colormode = _noop

    def mainloop(self):
        done()
    exitonclick = bye = mainloop


_screen = _Screen()
Pen = RawTurtle = Turtle


def Screen():
    return _screen


def bgcolor(*args):
    return _screen.bgcolor(*args)


def _default():
    if not _turtles:
        Turtle()
    return _turtles[0]


def _bind(name):
    def call(*args, **kwargs):
        return getattr(_default(), name)(*args, **kwargs)
    call.__name__ = name
    globals()[name] = call


for _name in ('forward', 'fd', 'backward', 'back', 'bk', 'left', 'lt', 'right', 'rt',
              'penup', 'pu', 'up', 'pendown', 'pd', 'down', 'isdown', 'goto', 'setpos',
              'setposition', 'setx', 'sety', 'setheading', 'seth', 'heading', 'position',
              'pos', 'xcor', 'ycor', 'home', 'color', 'pencolor', 'pensize', 'width',
              'circle', 'speed', 'shape', 'shapesize', 'fillcolor', 'begin_fill',
              'end_fill', 'hideturtle', 'ht', 'showturtle', 'st', 'dot', 'stamp', 'write',
              'clear'):
    _bind(_name)

for _name in ('setup', 'title', 'tracer', 'update', 'screensize', 'colormode'):
    globals()[_name] = getattr(_screen, _name)


def _render():
    if not _turtles or _state['written'] == len(_segments):
        return
    _state['written'] = len(_segments)
    half_w, half_h = _WIDTH / 2.0, _HEIGHT / 2.0
    parts = ['<svg xmlns="http://www.w3.org/2000/svg" width="%d" height="%d" '
             'viewBox="0 0 %d %d">' % (_WIDTH, _HEIGHT, _WIDTH, _HEIGHT),
             '<rect width="100%%" height="100%%" fill="%s"/>' % _esc(_state['bg'])]
    for x1, y1, x2, y2, color, width in _segments:
        parts.append('<line x1="%.2f" y1="%.2f" x2="%.2f" y2="%.2f" stroke="%s" '
                     'stroke-width="%d" stroke-linecap="round"/>'
                     % (x1 + half_w, half_h - y1, x2 + half_w, half_h - y2, _esc(color), width))
    parts.append('</svg>')
    with open(_os.path.join(_DIR, _OUT), 'w') as handle:
        handle.write('\n'.join(parts) + '\n')


def done():
    _render()
mainloop = exitonclick = bye = done

_atexit.register(_render)
)PY";

// ============================================================================
// BOOTSTRAP BODY
// ============================================================================
// Preceded by the generated constants block (_SENTINEL, _ROOT, _LIMITS,
// _INPUTS, _CODE, _TURTLE).

const char* const kBootstrapBody = R"PY(
_RUN = _os.path.join(_ROOT, 'run')
_LIB = _os.path.join(_ROOT, 'lib')
_sys.dont_write_bytecode = True


def _d(value):
    return _b64.b64decode(value)


def _prepare():
    import shutil
    shutil.rmtree(_RUN, ignore_errors=True)
    _os.makedirs(_RUN)
    _os.makedirs(_LIB, exist_ok=True)
    with open(_os.path.join(_LIB, 'turtle.py'), 'wb') as handle:
        handle.write(_d(_TURTLE))
    for path, content in _INPUTS:
        target = _os.path.join(_RUN, _d(path).decode('utf-8'))
        _os.makedirs(_os.path.dirname(target), exist_ok=True)
        with open(target, 'wb') as handle:
            handle.write(_d(content))
    _os.chdir(_RUN)
    _sys.path[:0] = [_LIB, _RUN]


def _status_of(code):
    if code is None:
        return 0
    if isinstance(code, int):
        return code
    print(code, file=_sys.stderr)
    return 1


def _run():
    source = _d(_CODE).decode('utf-8', 'replace')
    scope = {'__name__': '__main__', '__file__': 'main.py', '__builtins__': __builtins__}
    status = 0
    try:
        exec(compile(source, 'main.py', 'exec'), scope)
    except SystemExit as exc:
        status = _status_of(exc.code)
    except BaseException as exc:
        import traceback
        tb = exc.__traceback__.tb_next if exc.__traceback__ is not None else None
        traceback.print_exception(type(exc), exc, tb)
        status = 1
    try:
        import atexit
        atexit._run_exitfuncs()
    except BaseException as exc:
        print('atexit: %r' % (exc,), file=_sys.stderr)
    for stream in (_sys.stdout, _sys.stderr, _sys.__stdout__, _sys.__stderr__):
        try:
            stream.flush()
        except Exception:
            pass
    return status


def _manifest():
    import re
    import stat
    # Same rule as request paths; undecodable names (surrogate escapes) never match
    safe = re.compile(r'[A-Za-z0-9][A-Za-z0-9._/-]*\Z')
    max_files, max_file_bytes, max_total = _LIMITS
    files = []
    total = 0
    truncated = False
    for base, dirs, names in _os.walk(_RUN):
        dirs.sort()
        for name in sorted(names):
            full = _os.path.join(base, name)
            try:
                info = _os.lstat(full)
            except OSError:
                continue
            if not stat.S_ISREG(info.st_mode):
                continue
            rel = _os.path.relpath(full, _RUN).replace(_os.sep, '/')
            if not safe.match(rel):
                truncated = True
                continue
            if len(files) >= max_files:
                truncated = True
                continue
            try:
                with open(full, 'rb') as handle:
                    data = handle.read(max_file_bytes + 1)
            except OSError:
                truncated = True
                continue
            if len(data) > max_file_bytes:
                data = data[:max_file_bytes]
                truncated = True
            if total + len(data) > max_total:
                truncated = True
                continue
            total += len(data)
            files.append({'path': rel, 'size': len(data),
                          'data': _b64.b64encode(data).decode('ascii')})
    return files, truncated


def _emit(files, truncated):
    doc = _json.dumps({'files': files, 'truncated': truncated}, separators=(',', ':'))
    payload = ('\n' + _SENTINEL + '\n' + doc + '\n').encode('ascii')
    while payload:
        payload = payload[_os.write(1, payload):]


_prepare()
_status = _run()
try:
    _emit(*_manifest())
except OSError:
    pass
_os._exit(_status & 0xFF)
)PY";

std::string PyLiteral(const std::string& ascii) {
    return "'" + ascii + "'";
}

} // anonymous namespace

BootstrapEncoder::BootstrapEncoder(const RunnerConfig& config, std::string scratch_root)
    : scratch_root_(std::move(scratch_root))
    , max_files_(config.max_files)
    , max_file_bytes_(config.max_file_bytes)
    , max_archive_bytes_(config.max_archive_bytes) {
}

std::string BootstrapEncoder::NewSentinel() {
    return "__CODERUNNER_MANIFEST_" + EncodingUtils::RandomHex(kSentinelRandomBytes) + "__";
}

const std::string& BootstrapEncoder::TurtleModule() {
    static const std::string source(kTurtleSource);
    return source;
}

BootstrapScript BootstrapEncoder::Encode(const ExecutionRequest& request) const {
    static const std::string turtle_b64 = EncodingUtils::ToBase64(TurtleModule());

    BootstrapScript result;
    result.sentinel = NewSentinel();

    std::ostringstream script;
    script << "import base64 as _b64, json as _json, os as _os, sys as _sys\n";
    script << "_SENTINEL = " << PyLiteral(result.sentinel) << "\n";
    script << "_ROOT = " << PyLiteral(EncodingUtils::ToBase64(scratch_root_))
           << "\n_ROOT = _b64.b64decode(_ROOT).decode('utf-8')\n";
    script << "_LIMITS = (" << max_files_ << ", " << max_file_bytes_ << ", "
           << max_archive_bytes_ << ")\n";
    script << "_INPUTS = [";
    for (const auto& file : request.files) {
        script << "(" << PyLiteral(EncodingUtils::ToBase64(file.path)) << ", "
               << PyLiteral(EncodingUtils::ToBase64(file.content)) << "), ";
    }
    script << "]\n";
    script << "_CODE = " << PyLiteral(EncodingUtils::ToBase64(request.code)) << "\n";
    script << "_TURTLE = " << PyLiteral(turtle_b64) << "\n";
    script << kBootstrapBody;

    result.script = script.str();
    if (result.script.size() > kMaxInlineScriptBytes) {
        throw ValidationError("bootstrap_bytes", result.script.size(), kMaxInlineScriptBytes);
    }

    spdlog::debug("Bootstrap script: {} bytes, {} input files",
                  result.script.size(), request.files.size());
    return result;
}

} // namespace core
} // namespace coderunner

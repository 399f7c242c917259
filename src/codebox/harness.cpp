#include "harness.h"

const char kCheckerScript[] = R"py(
import sys

try:
    with open(sys.argv[1], encoding='utf-8') as f:
        source = f.read()
    compile(source, '<code>', 'exec', dont_inherit=True)
except SyntaxError as e:
    print('%s: %s (line %s)' % (type(e).__name__, e.msg, e.lineno))
    sys.exit(1)
except (ValueError, RecursionError, MemoryError, OverflowError) as e:
    print('%s: %s' % (type(e).__name__, e))
    sys.exit(1)
)py";

const char kRunnerScript[] = R"py(
import os
import sys

_report = os.fdopen(3, 'w', encoding='utf-8')
os.closerange(4, 1024)

import ast
import builtins
import json
import linecache
import traceback

_dumps = json.dumps
_exit = os._exit
_realpath = os.path.realpath
_fsdecode = os.fsdecode

SCRATCH = _realpath(os.getcwd())
CODE_FILE = '<code>'
BLOCKED = frozenset(m for m in (sys.argv[3] if len(sys.argv) > 3 else '').split(',') if m)

DENIED_EVENTS = frozenset((
    'os.system', 'os.exec', 'os.posix_spawn', 'os.spawn', 'os.fork', 'os.forkpty',
    'os.kill', 'os.killpg', 'os.putenv', 'os.unsetenv',
    'subprocess.Popen', 'pty.spawn',
    'socket.__new__', 'socket.connect', 'socket.bind', 'socket.sendto', 'socket.sendmsg',
    'socket.getaddrinfo', 'socket.gethostbyname', 'socket.gethostbyaddr',
    'ctypes.dlopen', 'ctypes.dlsym', 'ctypes.call_function',
))
# event -> positions of the path arguments that get created or modified
PATH_EVENTS = {
    'os.remove': (0,), 'os.rmdir': (0,), 'os.mkdir': (0,), 'os.chmod': (0,),
    'os.chown': (0,), 'os.truncate': (0,), 'os.utime': (0,), 'os.rename': (0, 1),
    'os.link': (1,), 'os.symlink': (1,), 'shutil.rmtree': (0,),
    'os.mkfifo': (0,), 'os.mknod': (0,),
}
WRITE_FLAGS = os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_TRUNC | os.O_APPEND


def _in_scratch(path):
    if isinstance(path, int):
        return True
    try:
        real = _realpath(_fsdecode(path))
    except (TypeError, ValueError):
        return False
    return real == SCRATCH or real.startswith(SCRATCH + '/')


def _audit(event, args):
    if event in DENIED_EVENTS:
        raise PermissionError('%s is not permitted in the sandbox' % event)
    if event == 'import':
        name = args[0] or ''
        if name in BLOCKED or name.split('.')[0] in BLOCKED:
            raise PermissionError('import of %s is not permitted in the sandbox' % name)
    elif event == 'open':
        path, mode, flags = args[0], args[1], args[2]
        writing = bool(flags & WRITE_FLAGS) if isinstance(flags, int) else False
        if isinstance(mode, str) and any(c in mode for c in 'wax+'):
            writing = True
        if writing and not _in_scratch(path):
            raise PermissionError('writing %r is not permitted outside %s' % (path, SCRATCH))
    elif event in PATH_EVENTS:
        for i in PATH_EVENTS[event]:
            if i < len(args) and not _in_scratch(args[i]):
                raise PermissionError('modifying %r is not permitted outside %s' % (args[i], SCRATCH))


def _traceback(exc):
    frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename == CODE_FILE]
    lines = ['Traceback (most recent call last):\n']
    lines += traceback.format_list(frames)
    lines += traceback.format_exception_only(type(exc), exc)
    return ''.join(lines)


def _error(kind, exc, message=None):
    if message is None:
        try:
            message = str(exc)
        except BaseException:
            message = '<unprintable %s>' % type(exc).__name__
    return {
        'status': 'error',
        'kind': kind,
        'exception': type(exc).__name__,
        'message': message,
        'traceback': _traceback(exc),
    }


def _encode(value):
    try:
        _dumps(value, allow_nan=False)
        return {'value': value, 'value_repr': False}
    except (TypeError, ValueError, OverflowError, RecursionError):
        pass
    try:
        text = repr(value)
    except BaseException:
        text = '<unrepresentable %s>' % type(value).__name__
    return {'value': text, 'value_repr': True}


def _finish(result):
    for stream in (sys.stdout, sys.stderr):
        try:
            stream.flush()
        except BaseException:
            pass
    try:
        line = _dumps(result, allow_nan=False)
    except BaseException:
        line = _dumps({'status': 'error', 'kind': 'RuntimeError', 'exception': '',
                       'message': 'result could not be serialized', 'traceback': ''})
    _report.write(line + '\n')
    _report.flush()
    _exit(0)


def main():
    with open(sys.argv[1], encoding='utf-8') as f:
        source = f.read()
    with open(sys.argv[2], encoding='utf-8') as f:
        bindings = json.load(f)
    linecache.cache[CODE_FILE] = (len(source), None, source.splitlines(True), CODE_FILE)

    # compiled before the hook; the last expression statement, if any, is the value
    tree = ast.parse(source, CODE_FILE)
    tail = None
    if tree.body and isinstance(tree.body[-1], ast.Expr):
        tail = ast.Expression(tree.body.pop().value)
    body = compile(tree, CODE_FILE, 'exec', dont_inherit=True)
    tail = compile(tail, CODE_FILE, 'eval', dont_inherit=True) if tail is not None else None

    namespace = {'__name__': '__main__', '__builtins__': builtins}
    namespace.update(bindings)

    for name in list(sys.modules):
        if name.split('.')[0] in BLOCKED:
            del sys.modules[name]
    sys.addaudithook(_audit)

    try:
        exec(body, namespace)
        if tail is not None:
            value = eval(tail, namespace)
        elif callable(namespace.get('main')):
            value = namespace['main'](**bindings)
        else:
            value = None
        result = {'status': 'ok'}
        result.update(_encode(value))
    except SystemExit as e:
        if e.code is None or e.code == 0:
            result = {'status': 'ok', 'value': None, 'value_repr': False}
        else:
            result = _error('RuntimeError', e, 'exit status %s' % (e.code,))
    except MemoryError:
        namespace.clear()
        result = {'status': 'memory'}
    except PermissionError as e:
        result = _error('PermissionDenied', e)
    except BaseException as e:
        result = _error('RuntimeError', e)
    _finish(result)


main()
)py";

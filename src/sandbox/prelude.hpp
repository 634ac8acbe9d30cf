/*
 * prelude.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file prelude.hpp
 * @brief Python source of the sandbox helper module
 *
 * Executed once per helper-engine build into a private module. It
 * provides the namespace factory (restricted builtins, guarded import,
 * read-only module views, data and plotting helpers) and the glue that
 * binds host objects into a run's namespace.
 */

#ifndef ASSAY_SANDBOX_PRELUDE_HPP
#define ASSAY_SANDBOX_PRELUDE_HPP

namespace assay::sandbox {

inline constexpr const char* kPreludeSource = R"PY(
import base64 as _base64
import builtins as _builtins
import datetime as _datetime
import decimal as _decimal
import importlib as _importlib
import io as _io
import json as _json
import time as _time
import traceback as _traceback
import types as _types


class SandboxInterrupt(BaseException):
    """Raised asynchronously when a governed limit stops the run."""


_BLOCKED_BUILTINS = frozenset({
    'eval', 'exec', 'compile', 'open', 'input', 'breakpoint', 'exit', 'quit',
    'help', 'globals', 'vars', 'getattr', 'setattr', 'delattr', 'memoryview',
    'copyright', 'credits', 'license',
})

_VISIBLE_DUNDERS = frozenset({'__name__', '__doc__', '__version__', '__all__'})

_PRELOADED = (
    'math', 'statistics', 'decimal', 'fractions', 'random', 'json', 'datetime',
    're', 'collections', 'itertools', 'functools', 'operator', 'string',
    'textwrap', 'calendar', 'bisect', 'heapq', 'copy', 'numbers',
)

_real_import = _builtins.__import__


class _Sealed(type):
    """Metaclass of helper classes: class attributes cannot be rebound."""

    def __setattr__(cls, name, value):
        raise AttributeError(f"'{cls.__name__}' is read-only inside the sandbox")

    def __delattr__(cls, name):
        raise AttributeError(f"'{cls.__name__}' is read-only inside the sandbox")


_views = {}
_overrides = {}
_helpers = {}


def _module_root(module):
    return str(getattr(module, '__name__', '') or '').partition('.')[0]


def _read_only(module, allowed):
    """Attribute-level read-only view of a module.

    Private names are hidden. A submodule reached through an attribute is
    handed out only when its top-level package is itself allowed, so
    stdlib modules cannot leak os or sys through their own imports.
    """
    key = getattr(module, '__name__', None) or id(module)
    cached = _views.get((key, allowed))
    if cached is not None:
        return cached

    label = str(key)
    replaced = _overrides.get(key, {})

    class ReadOnlyModule(metaclass=_Sealed):
        __slots__ = ()

        def __getattribute__(self, name):
            if name in replaced:
                return replaced[name]
            if name.startswith('_') and name not in _VISIBLE_DUNDERS:
                raise AttributeError(
                    f"'{name}' is not available on sandbox modules")
            value = getattr(module, name)
            if isinstance(value, _types.ModuleType):
                root = _module_root(value)
                if root not in allowed:
                    raise AttributeError(
                        f"module '{root}' is not available in the sandbox")
                return _read_only(value, allowed)
            return value

        def __setattr__(self, name, value):
            raise AttributeError(
                f"module '{label}' is read-only inside the sandbox")

        def __delattr__(self, name):
            raise AttributeError(
                f"module '{label}' is read-only inside the sandbox")

        def __dir__(self):
            return sorted(n for n in dir(module) if not n.startswith('_'))

        def __repr__(self):
            return f"<read-only module '{label}'>"

    view = ReadOnlyModule()
    _views[(key, allowed)] = view
    return view


def _sleep(seconds):
    seconds = float(seconds)
    if seconds < 0:
        raise ValueError('sleep length must be non-negative')
    end = _time.monotonic() + seconds
    while True:
        remaining = end - _time.monotonic()
        if remaining <= 0:
            return None
        _time.sleep(min(remaining, 0.05))


def _bounded_time():
    module = _types.ModuleType('time')
    for name in ('time', 'time_ns', 'monotonic', 'monotonic_ns', 'perf_counter',
                 'perf_counter_ns', 'process_time', 'strftime', 'strptime',
                 'gmtime', 'localtime', 'mktime', 'ctime', 'asctime',
                 'struct_time', 'timezone', 'altzone', 'daylight', 'tzname'):
        if hasattr(_time, name):
            setattr(module, name, getattr(_time, name))
    module.sleep = _sleep
    return _read_only(module, frozenset({'time'}))


_TIME = _bounded_time()


def _import_error(name, allowed):
    shown = ', '.join(sorted(allowed))
    return ImportError(
        f"Module '{name}' is not allowed in the sandbox. Allowed modules: {shown}")


def _guarded_import_for(allowed):
    def __import__(name, globals=None, locals=None, fromlist=(), level=0):
        if level != 0:
            raise ImportError('Relative imports are not available in the sandbox')
        root = name.partition('.')[0]
        if root not in allowed:
            raise _import_error(name, allowed)
        if root == 'time':
            return _TIME
        if root in _helpers and _helpers[root] is None:
            raise ImportError(f"Module '{root}' is not installed")
        module = _real_import(name, globals, locals, fromlist, level)
        return _read_only(module, allowed)
    return __import__


def _restricted_builtins(allowed):
    table = {k: v for k, v in vars(_builtins).items()
             if k not in _BLOCKED_BUILTINS}
    table['__import__'] = _guarded_import_for(allowed)
    return table


class Table(metaclass=_Sealed):
    """Rows of records with simple column helpers.

    Table([{'a': 1}, {'a': 2}]).sum('a') == 3
    """

    def __init__(self, rows=None, columns=None):
        self._rows = [dict(r) for r in (rows or [])]
        if columns is None:
            seen = []
            for row in self._rows:
                for key in row:
                    if key not in seen:
                        seen.append(key)
            columns = seen
        self._columns = list(columns)

    @classmethod
    def from_records(cls, rows):
        if isinstance(rows, dict) and 'data' in rows:
            rows = rows['data']
        return cls(rows or [])

    @property
    def columns(self):
        return list(self._columns)

    def __len__(self):
        return len(self._rows)

    def __iter__(self):
        return iter(self._rows)

    def __getitem__(self, key):
        if isinstance(key, str):
            return self.column(key)
        if isinstance(key, slice):
            return Table(self._rows[key], self._columns)
        return self._rows[key]

    def column(self, name):
        return [row.get(name) for row in self._rows]

    def where(self, predicate=None, **equals):
        def keep(row):
            if predicate is not None and not predicate(row):
                return False
            return all(row.get(k) == v for k, v in equals.items())
        return Table([r for r in self._rows if keep(r)], self._columns)

    def select(self, *names):
        return Table([{n: r.get(n) for n in names} for r in self._rows], names)

    def sort_by(self, name, reverse=False):
        present = [r for r in self._rows if r.get(name) is not None]
        missing = [r for r in self._rows if r.get(name) is None]
        present.sort(key=lambda r: r[name], reverse=reverse)
        return Table(present + missing, self._columns)

    def group_by(self, name):
        groups = {}
        for row in self._rows:
            groups.setdefault(row.get(name), []).append(row)
        return {k: Table(v, self._columns) for k, v in groups.items()}

    def count_by(self, name):
        return {k: len(v) for k, v in self.group_by(name).items()}

    def _numbers(self, name):
        values = []
        for value in self.column(name):
            if value is None or value == '':
                continue
            values.append(float(value))
        return values

    def sum(self, name):
        return sum(self._numbers(name))

    def mean(self, name):
        values = self._numbers(name)
        return sum(values) / len(values) if values else None

    def min(self, name):
        values = self._numbers(name)
        return min(values) if values else None

    def max(self, name):
        values = self._numbers(name)
        return max(values) if values else None

    def head(self, n=5):
        return Table(self._rows[:n], self._columns)

    def to_records(self):
        return [dict(r) for r in self._rows]

    def __str__(self):
        shown = self._rows[:20]
        widths = {c: len(str(c)) for c in self._columns}
        for row in shown:
            for c in self._columns:
                widths[c] = max(widths[c], len(str(row.get(c, ''))))
        header = ' | '.join(str(c).ljust(widths[c]) for c in self._columns)
        rule = '-+-'.join('-' * widths[c] for c in self._columns)
        lines = [header, rule]
        for row in shown:
            lines.append(' | '.join(
                str(row.get(c, '')).ljust(widths[c]) for c in self._columns))
        if len(self._rows) > len(shown):
            lines.append(f'... {len(self._rows) - len(shown)} more rows')
        return '\n'.join(lines)

    def __repr__(self):
        return f'Table({len(self._rows)} rows x {len(self._columns)} columns)'


def _blocked_file_write(*args, **kwargs):
    raise PermissionError(
        'Writing figures to files is disabled; use figure_to_base64()')


def _memory_savefig(target, *args, **kwargs):
    if not hasattr(target, 'write'):
        _blocked_file_write()
    return _helpers['matplotlib.pyplot'].savefig(target, *args, **kwargs)


def figure_to_base64(fig=None, format='png', dpi=100):
    """Render a matplotlib figure to a base64 string and close it."""
    pyplot = _helpers.get('matplotlib.pyplot')
    if pyplot is None:
        raise RuntimeError('matplotlib is not installed')
    fig = fig if fig is not None else pyplot.gcf()
    buffer = _io.BytesIO()
    fig.savefig(buffer, format=format, dpi=dpi, bbox_inches='tight')
    pyplot.close(fig)
    return _base64.b64encode(buffer.getvalue()).decode('ascii')


def load_helpers(enabled):
    """Import the optional data helpers; returns the names available."""
    available = []
    for root in ('numpy', 'pandas', 'matplotlib'):
        _helpers[root] = None
    if not enabled:
        return available
    for root in ('numpy', 'pandas'):
        try:
            _helpers[root] = _importlib.import_module(root)
            available.append(root)
        except Exception:
            _helpers[root] = None
    try:
        matplotlib = _importlib.import_module('matplotlib')
        matplotlib.use('Agg')
        pyplot = _importlib.import_module('matplotlib.pyplot')
        _overrides['matplotlib.pyplot'] = {
            'savefig': _memory_savefig,
            'show': lambda *a, **k: None,
            'imsave': _blocked_file_write,
        }
        _helpers['matplotlib'] = matplotlib
        _helpers['matplotlib.pyplot'] = pyplot
        available.append('matplotlib')
    except Exception:
        _helpers['matplotlib'] = None
    return available


def make_namespace(allowed_modules, enable_helpers):
    """Fresh globals for one run."""
    allowed = frozenset(allowed_modules)
    ns = {
        '__builtins__': _restricted_builtins(allowed),
        '__name__': '__sandbox__',
        '__doc__': None,
    }
    for name in _PRELOADED:
        if name in allowed:
            ns[name] = _read_only(_importlib.import_module(name), allowed)
    if 'time' in allowed:
        ns['time'] = _TIME
    ns['Table'] = Table
    if enable_helpers:
        if 'numpy' in allowed and _helpers.get('numpy') is not None:
            ns['np'] = _read_only(_helpers['numpy'], allowed)
        if 'pandas' in allowed and _helpers.get('pandas') is not None:
            ns['pd'] = _read_only(_helpers['pandas'], allowed)
        if 'matplotlib' in allowed and _helpers.get('matplotlib') is not None:
            ns['plt'] = _read_only(_helpers['matplotlib.pyplot'], allowed)
    ns['figure_to_base64'] = figure_to_base64
    return ns


def _jsonable(value):
    if hasattr(value, 'item') and callable(value.item):
        try:
            return value.item()
        except Exception:
            pass
    if isinstance(value, (_datetime.date, _datetime.datetime, _datetime.time)):
        return value.isoformat()
    if isinstance(value, _decimal.Decimal):
        return float(value)
    if isinstance(value, (set, frozenset, tuple)):
        return list(value)
    if hasattr(value, 'to_dict') and callable(value.to_dict):
        try:
            return value.to_dict(orient='records')
        except TypeError:
            return value.to_dict()
    return str(value)


def _dumps(value):
    return _json.dumps(value, default=_jsonable)


def _encode(arguments):
    kept = {k: v for k, v in arguments.items() if v is not None}
    return _json.dumps(kept, default=_jsonable)


class _Namespace(metaclass=_Sealed):
    __slots__ = ()

    def __setattr__(self, name, value):
        raise AttributeError('sandbox helpers are read-only')

    def __delattr__(self, name):
        raise AttributeError('sandbox helpers are read-only')


def _frozen(name, doc, members):
    cls = _Sealed(name, (_Namespace,), dict(members, __doc__=doc, __slots__=()))
    return cls()


def bind_host(ns, bridge, data):
    """Bind the tool bridge and data proxy handles into a namespace."""

    def call(name, **arguments):
        return _json.loads(bridge.call(name, _encode(arguments)))

    def fetch_records(source, filters=None, fields=None, limit=100):
        """{success, data, count}: records of a source matching filters."""
        return call('fetch_records', source=source, filters=filters,
                    fields=fields, limit=limit)

    def fetch_record(source, id):
        """{success, data}: one record by id."""
        return call('fetch_record', source=source, id=id)

    def run_report(name, filters=None):
        """{success, data, columns, status}: report rows."""
        return call('run_report', name=name, filters=filters)

    def describe_report(name):
        """{success, columns, filter_guidance}"""
        return call('describe_report', name=name)

    def list_reports(module=None, type=None):
        """{success, reports, count}"""
        return call('list_reports', module=module, type=type)

    def search(query, source=None, limit=20):
        """{success, results}"""
        return call('search', query=query, source=source, limit=limit)

    def describe_schema(source):
        """{success, fields, links}"""
        return call('describe_schema', source=source)

    def available():
        return _json.loads(bridge.describe())

    functions = {
        'fetch_records': fetch_records,
        'fetch_record': fetch_record,
        'run_report': run_report,
        'describe_report': describe_report,
        'list_reports': list_reports,
        'search': search,
        'describe_schema': describe_schema,
    }

    def tools_call(self, name, **arguments):
        return call(name, **arguments)

    def tools_list(self):
        return available()

    members = {k: staticmethod(v) for k, v in functions.items()}
    members['call'] = tools_call
    members['list'] = tools_list
    members['__repr__'] = lambda self: '<sandbox tools>'
    ns['tools'] = _frozen('Tools', 'Platform read operations.', members)
    ns.update(functions)

    def query(self, statement, params=None):
        return _json.loads(data.query(
            statement, _dumps(params if params is not None else [])))

    def exists(self, source, filters=None):
        return _json.loads(data.exists(source, _dumps(filters or {})))

    def count(self, source, filters=None):
        return _json.loads(data.count(source, _dumps(filters or {})))

    def get_value(self, source, filters, field):
        return _json.loads(data.get_value(source, _dumps(filters or {}), field))

    def describe(self, source):
        return _json.loads(data.describe(source))

    ns['db'] = _frozen('ReadOnlyDatabase', 'Read-only query access.', {
        'query': query,
        'exists': exists,
        'count': count,
        'get_value': get_value,
        'describe': describe,
        '__repr__': lambda self: '<read-only database>',
    })


def bind_prefetch(ns, payload):
    """Bind data / data_result from a data_query pre-fetch."""
    result = _json.loads(payload)
    ns['data_result'] = result
    if result.get('success'):
        ns['data'] = result.get('data', [])
    else:
        ns['data'] = []


def render_value(value):
    try:
        return str(value)
    except Exception:
        try:
            return repr(value)
        except Exception as exc:
            return f'<unrenderable {type(value).__name__}: {exc}>'


def format_exception(exc):
    return ''.join(_traceback.format_exception(type(exc), exc, exc.__traceback__))


def healthy():
    return _json.loads(_json.dumps({'ok': True}))['ok'] is True
)PY";

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_PRELUDE_HPP

#pragma once

#include <cstdint>

namespace tessera
{

// Logical panel identifier, assigned by the UI window store.
using WindowId = uint64_t;

// Tab identifier, assigned by the view process. Never reused.
using TabId = uint64_t;

// Monotonic per-window navigation sequence, assigned by the UI when it
// issues a loadUrl.  0 means "not initiated by the UI".
using NavSeq = uint64_t;

inline constexpr WindowId INVALID_WINDOW_ID = 0;
inline constexpr TabId    INVALID_TAB_ID    = 0;

struct Rect;
struct RectF;
struct TabState;
struct ImageRef;
struct Config;

class Logger;

namespace view
{
class Surface;
class SurfaceHost;
class ViewRegistry;
class TabManager;
class SnapshotService;
class ViewService;
}   // namespace view

namespace ui
{
class ViewClient;
class WindowStore;
class KeyValueStore;
class BoundsSynchronizer;
class FreezeController;
class StateReconciler;
class ViewLifecycle;
class BrowserWindowController;
}   // namespace ui

}   // namespace tessera

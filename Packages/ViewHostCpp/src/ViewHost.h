#pragma once

#include "component/ChangeDetection.h"
#include "component/ComponentBootstrap.h"
#include "component/ComponentDef.h"
#include "component/ComponentRef.h"
#include "component/Injector.h"
#include "component/ViewRef.h"
#include "host/HostLocator.h"
#include "host/NativeElement.h"
#include "host/NativeSurface.h"
#include "host/Renderer.h"
#include "host/SurfaceRenderer.h"
#include "runtime/ViewHostRuntime.h"
#include "scheduler/DirtyScheduler.h"
#include "scheduler/FrameScheduler.h"
#include "shared/ViewHostErrors.h"
#include "shared/ViewHostFeatureFlags.h"
#include "shared/ViewHostLogger.h"
#include "view/RenderContextStack.h"
#include "view/ViewInstructions.h"

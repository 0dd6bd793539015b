#pragma once

#include "dicon/export.hpp"
#include "dicon/fwd.hpp"
#include "dicon/exceptions.hpp"
#include "dicon/value.hpp"
#include "dicon/boxed.hpp"
#include "dicon/parameter.hpp"
#include "dicon/type_traits.hpp"
#include "dicon/callable.hpp"
#include "dicon/type_catalog.hpp"
#include "dicon/interfaces.hpp"
#include "dicon/registry.hpp"
#include "dicon/resolver.hpp"
#include "dicon/container.hpp"

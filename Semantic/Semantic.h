#ifndef _Semantic_Semantic_h_
#define _Semantic_Semantic_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <cerrno>
#include <csignal>
#include <algorithm>
#include <array>
#include <fstream>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// System includes
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

// External library includes
#include <yaml-cpp/yaml.h>

#include "semantic_common.h"
#include "errors.h"
#include "utils.h"
#include "presets.h"
#include "mapping_store.h"
#include "config_store.h"
#include "translator.h"
#include "executor.h"
#include "shell_init.h"
#include "wizard.h"
#include "input.h"
#include "wizard_screen.h"
#include "cli.h"

#endif

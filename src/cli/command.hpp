#pragma once

using command_fn = int (*)(int argc, char **argv);

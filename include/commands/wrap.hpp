#pragma once

int cmd_wrap(int argc, char** argv);

#pragma once

int cmd_sanitize(int argc, char** argv);

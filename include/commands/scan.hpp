#pragma once

int cmd_scan(int argc, char** argv);

#pragma once

int cmd_rules(int argc, char** argv);

#pragma once

int cmd_repair(int argc, char** argv);

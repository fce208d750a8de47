#pragma once

int cmd_format(int argc, char** argv);

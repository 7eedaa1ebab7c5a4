#pragma once

// cvextract extract <tokens.json|file.pdf> [options]
int cmd_extract(int argc, char** argv);

#pragma once

int cmd_embed_vocab(int argc, char** argv);

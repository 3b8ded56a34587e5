#include "pipeline.hpp"
#include "figure/figure_plugin.hpp"
#include "figure/plugin_config.hpp"
#include "../lib/log.h"
#include "../lib/strbuf.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>  // access

using namespace figmark;

#define EXIT_USAGE 1
#define EXIT_IO 2

static void print_usage(FILE* out) {
    fprintf(out, "Usage: figmark [options] <input.md>\n");
    fprintf(out, "Render markdown to HTML, turning image paragraphs into <figure> elements.\n\n");
    fprintf(out, "Options:\n");
    fprintf(out, "  -o, --output <file>          write HTML to <file> instead of stdout\n");
    fprintf(out, "  --image-link                 wrap each figure image in a link to its source\n");
    fprintf(out, "  --skip-no-caption            leave image paragraphs without caption as <p>\n");
    fprintf(out, "  --figure-option <key=value>  set a figure option (repeatable)\n");
    fprintf(out, "  --no-figure                  render without the figure extension\n");
    fprintf(out, "  --log-level <level>          debug, info, notice, warn, error, fatal\n");
    fprintf(out, "  -h, --help                   show this help\n\n");
    fprintf(out, "Use '-' as input to read from stdin.\n");
}

// read the whole input into a string; "-" is stdin
static bool read_input(const char* path, std::string* out) {
    bool use_stdin = strcmp(path, "-") == 0;
    FILE* file = use_stdin ? stdin : fopen(path, "rb");
    if (!file) {
        log_error("cannot open '%s': %s", path, err_code_message(ERR_FILE_NOT_FOUND));
        return false;
    }
    StrBuf* buf = strbuf_new();
    bool ok = strbuf_append_file(buf, file);
    if (!use_stdin) fclose(file);
    if (!ok) {
        log_error("failed to read '%s': %s", path, err_code_message(ERR_FILE_READ_ERROR));
        strbuf_free(buf);
        return false;
    }
    out->assign(buf->str ? buf->str : "", buf->length);
    strbuf_free(buf);
    return true;
}

static bool write_output(const char* path, const std::string& html) {
    FILE* file = path ? fopen(path, "wb") : stdout;
    if (!file) {
        log_error("cannot open '%s' for writing: %s", path, err_code_message(ERR_FILE_WRITE_ERROR));
        return false;
    }
    size_t written = fwrite(html.data(), 1, html.size(), file);
    bool ok = written == html.size();
    if (path) {
        if (fclose(file) != 0) ok = false;
    } else if (fflush(file) != 0) {
        ok = false;
    }
    if (!ok) log_error("failed to write '%s': %s", path ? path : "stdout", err_code_message(ERR_FILE_WRITE_ERROR));
    return ok;
}

static int run(int argc, char* argv[]) {
    const char* input_file = NULL;
    const char* output_file = NULL;
    bool use_figure = true;
    PluginConfig config;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(stdout);
            return 0;
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (i + 1 >= argc) {
                fprintf(stderr, "Error: %s requires a file argument\n", arg);
                return EXIT_USAGE;
            }
            output_file = argv[++i];
        } else if (strcmp(arg, "--image-link") == 0) {
            config.image_link = true;
        } else if (strcmp(arg, "--skip-no-caption") == 0) {
            config.skip_no_caption = true;
        } else if (strcmp(arg, "--figure-option") == 0) {
            if (i + 1 >= argc) {
                fprintf(stderr, "Error: --figure-option requires key=value\n");
                return EXIT_USAGE;
            }
            FigmarkErrorCode rc = plugin_config_parse(argv[++i], &config, true);
            if (rc != ERR_OK) {
                fprintf(stderr, "Error: invalid figure option '%s' (%s)\n", argv[i], err_code_name(rc));
                return EXIT_USAGE;
            }
        } else if (strcmp(arg, "--no-figure") == 0) {
            use_figure = false;
        } else if (strcmp(arg, "--log-level") == 0) {
            if (i + 1 >= argc) {
                fprintf(stderr, "Error: --log-level requires a level\n");
                return EXIT_USAGE;
            }
            int level = log_level_from_string(argv[++i]);
            if (level < 0) {
                fprintf(stderr, "Error: unknown log level '%s'\n", argv[i]);
                return EXIT_USAGE;
            }
            log_set_level(log_default_category, level);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fprintf(stderr, "Error: unknown option '%s'\n", arg);
            print_usage(stderr);
            return EXIT_USAGE;
        } else if (!input_file) {
            input_file = arg;
        } else {
            fprintf(stderr, "Error: more than one input file given\n");
            return EXIT_USAGE;
        }
    }

    if (!input_file) {
        fprintf(stderr, "Error: no input file\n");
        print_usage(stderr);
        return EXIT_USAGE;
    }

    MarkdownPipeline pipeline;
    if (use_figure) {
        FigmarkErrorCode rc = figure_plugin(pipeline, config);
        if (rc != ERR_OK) {
            fprintf(stderr, "Error: figure extension setup failed (%s)\n", err_code_message(rc));
            return EXIT_USAGE;
        }
    }

    std::string source;
    if (!read_input(input_file, &source)) return EXIT_IO;
    log_debug("read %zu bytes from %s", source.size(), input_file);

    std::string html = pipeline.render_markdown(source);
    if (!write_output(output_file, html)) return EXIT_IO;
    return 0;
}

int main(int argc, char* argv[]) {
    log_init(NULL);
    // optional per-directory logging overrides
    if (access("figmark.log.conf", F_OK) == 0) {
        if (log_parse_config_file("figmark.log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: failed to parse figmark.log.conf, using defaults\n");
        }
    }

    int rc = run(argc, argv);
    log_finish();
    return rc;
}

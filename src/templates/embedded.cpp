#include <pmat/templates/embedded.hpp>

namespace pmat::templates {

namespace {

// ---------------------------------------------------------------------------
// rust
// ---------------------------------------------------------------------------

const char* RUST_MAKEFILE_META = R"JSON({
  "uri": "template://rust/makefile/cli",
  "name": "cli",
  "description": "Makefile for a Rust CLI crate with build, test, lint and release targets",
  "filename": "Makefile",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Crate and binary name"},
    {"name": "has_tests", "type": "boolean", "required": false, "default": "true",
     "description": "Add a test target"},
    {"name": "has_benchmarks", "type": "boolean", "required": false, "default": "false",
     "description": "Add a bench target"}
  ]
})JSON";

const char* RUST_MAKEFILE =
    "# Makefile for {{project_name}}\n"
    ".PHONY: all build test lint fmt clean release{{#if has_benchmarks}} bench{{/if}}\n"
    "\n"
    "all: build{{#if has_tests}} test{{/if}}\n"
    "\n"
    "build:\n"
    "\tcargo build\n"
    "\n"
    "{{#if has_tests}}test:\n"
    "\tcargo test --all-features\n"
    "\n"
    "{{/if}}{{#if has_benchmarks}}bench:\n"
    "\tcargo bench\n"
    "\n"
    "{{/if}}lint:\n"
    "\tcargo clippy --all-targets -- -D warnings\n"
    "\n"
    "fmt:\n"
    "\tcargo fmt --all\n"
    "\n"
    "release:\n"
    "\tcargo build --release --bin {{project_name}}\n"
    "\n"
    "clean:\n"
    "\tcargo clean\n";

const char* RUST_README_META = R"JSON({
  "uri": "template://rust/readme/cli",
  "name": "cli",
  "description": "README for a Rust command line tool",
  "filename": "README.md",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Crate and binary name"},
    {"name": "description", "type": "string", "required": false,
     "default": "A command line tool", "description": "One line summary"},
    {"name": "author", "type": "github_username", "required": false, "default": "",
     "description": "GitHub user or organisation"},
    {"name": "license", "type": "license", "required": false, "default": "MIT",
     "description": "SPDX license identifier"}
  ]
})JSON";

const char* RUST_README = R"TPL(# {{project_name}}

{{description}}

## Installation

```sh
cargo install {{project_name}}
```

## Usage

```sh
{{project_name}} --help
```
{{#if author}}
Maintained by [@{{author}}](https://github.com/{{author}}).
{{/if}}
## License

{{license}}
)TPL";

const char* RUST_GITIGNORE_META = R"JSON({
  "uri": "template://rust/gitignore/cli",
  "name": "cli",
  "description": "Git ignore rules for a Rust crate",
  "filename": ".gitignore",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Crate name"},
    {"name": "ignore_lockfile", "type": "boolean", "required": false, "default": "false",
     "description": "Ignore Cargo.lock (libraries only)"}
  ]
})JSON";

const char* RUST_GITIGNORE = R"TPL(# {{project_name}}
/target/
**/*.rs.bk
*.pdb
{{#if ignore_lockfile}}Cargo.lock
{{/if}}.idea/
.vscode/
.DS_Store
)TPL";

const char* RUST_CARGO_META = R"JSON({
  "uri": "template://rust/cargo/cli-binary",
  "name": "cli-binary",
  "description": "Cargo manifest for a single binary CLI crate",
  "filename": "Cargo.toml",
  "version": "1.1.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Crate and binary name"},
    {"name": "version", "type": "semver", "required": false, "default": "0.1.0",
     "description": "Initial crate version"},
    {"name": "license", "type": "license", "required": false, "default": "MIT",
     "description": "SPDX license identifier"},
    {"name": "edition", "type": "string", "required": false, "default": "2021",
     "pattern": "20(15|18|21|24)", "description": "Rust edition"}
  ]
})JSON";

const char* RUST_CARGO = R"TPL(package.name = "{{project_name}}"
package.version = "{{version}}"
package.edition = "{{edition}}"
package.license = "{{license}}"

[[bin]]
name = "{{project_name}}"
path = "src/main.rs"

[dependencies]
clap = { version = "4", features = ["derive"] }
anyhow = "1"

[profile.release]
lto = true
codegen-units = 1
)TPL";

// ---------------------------------------------------------------------------
// deno
// ---------------------------------------------------------------------------

const char* DENO_MAKEFILE_META = R"JSON({
  "uri": "template://deno/makefile/cli",
  "name": "cli",
  "description": "Makefile for a Deno TypeScript CLI",
  "filename": "Makefile",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Executable name"},
    {"name": "entry", "type": "string", "required": false, "default": "main.ts",
     "description": "Entry module"}
  ]
})JSON";

const char* DENO_MAKEFILE =
    "# Makefile for {{project_name}}\n"
    ".PHONY: all run test lint fmt check compile clean\n"
    "\n"
    "all: check test\n"
    "\n"
    "run:\n"
    "\tdeno run --allow-read {{entry}}\n"
    "\n"
    "test:\n"
    "\tdeno test --allow-read\n"
    "\n"
    "lint:\n"
    "\tdeno lint\n"
    "\n"
    "fmt:\n"
    "\tdeno fmt\n"
    "\n"
    "check:\n"
    "\tdeno check {{entry}}\n"
    "\n"
    "compile:\n"
    "\tdeno compile --allow-read --output {{project_name}} {{entry}}\n"
    "\n"
    "clean:\n"
    "\trm -f {{project_name}}\n";

const char* DENO_README_META = R"JSON({
  "uri": "template://deno/readme/cli",
  "name": "cli",
  "description": "README for a Deno TypeScript CLI",
  "filename": "README.md",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Executable name"},
    {"name": "description", "type": "string", "required": false,
     "default": "A Deno command line tool", "description": "One line summary"},
    {"name": "license", "type": "license", "required": false, "default": "MIT",
     "description": "SPDX license identifier"}
  ]
})JSON";

const char* DENO_README = R"TPL(# {{project_name}}

{{description}}

## Usage

```sh
deno run --allow-read main.ts --help
```

## Building

```sh
make compile
```

## License

{{license}}
)TPL";

const char* DENO_GITIGNORE_META = R"JSON({
  "uri": "template://deno/gitignore/cli",
  "name": "cli",
  "description": "Git ignore rules for a Deno project",
  "filename": ".gitignore",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Executable name"}
  ]
})JSON";

const char* DENO_GITIGNORE = R"TPL(# {{project_name}}
/{{project_name}}
.deno/
coverage/
node_modules/
.env
.DS_Store
)TPL";

// ---------------------------------------------------------------------------
// python-uv
// ---------------------------------------------------------------------------

const char* PYTHON_MAKEFILE_META = R"JSON({
  "uri": "template://python-uv/makefile/cli",
  "name": "cli",
  "description": "Makefile for a Python CLI managed with uv",
  "filename": "Makefile",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Package name"},
    {"name": "python_version", "type": "string", "required": false, "default": "3.12",
     "pattern": "3\\.[0-9]+", "description": "Python version"}
  ]
})JSON";

const char* PYTHON_MAKEFILE =
    "# Makefile for {{project_name}}\n"
    ".PHONY: all install test lint fmt typecheck clean\n"
    "\n"
    "all: lint test\n"
    "\n"
    "install:\n"
    "\tuv sync --python {{python_version}}\n"
    "\n"
    "test:\n"
    "\tuv run pytest\n"
    "\n"
    "lint:\n"
    "\tuv run ruff check .\n"
    "\n"
    "fmt:\n"
    "\tuv run ruff format .\n"
    "\n"
    "typecheck:\n"
    "\tuv run mypy src\n"
    "\n"
    "clean:\n"
    "\trm -rf .venv .pytest_cache .ruff_cache dist\n";

const char* PYTHON_README_META = R"JSON({
  "uri": "template://python-uv/readme/cli",
  "name": "cli",
  "description": "README for a Python CLI managed with uv",
  "filename": "README.md",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Package name"},
    {"name": "description", "type": "string", "required": false,
     "default": "A Python command line tool", "description": "One line summary"},
    {"name": "license", "type": "license", "required": false, "default": "MIT",
     "description": "SPDX license identifier"}
  ]
})JSON";

const char* PYTHON_README = R"TPL(# {{project_name}}

{{description}}

## Development

```sh
uv sync
uv run {{project_name}} --help
```

## License

{{license}}
)TPL";

const char* PYTHON_GITIGNORE_META = R"JSON({
  "uri": "template://python-uv/gitignore/cli",
  "name": "cli",
  "description": "Git ignore rules for a Python project",
  "filename": ".gitignore",
  "version": "1.0.0",
  "parameters": [
    {"name": "project_name", "type": "project_name", "required": true,
     "description": "Package name"}
  ]
})JSON";

const char* PYTHON_GITIGNORE = R"TPL(# {{project_name}}
__pycache__/
*.py[cod]
.venv/
.pytest_cache/
.ruff_cache/
.mypy_cache/
dist/
*.egg-info/
)TPL";

} // namespace

const std::vector<EmbeddedTemplate>& embedded_templates() {
    static const std::vector<EmbeddedTemplate> all = {
        {RUST_MAKEFILE_META, RUST_MAKEFILE},
        {RUST_README_META, RUST_README},
        {RUST_GITIGNORE_META, RUST_GITIGNORE},
        {RUST_CARGO_META, RUST_CARGO},
        {DENO_MAKEFILE_META, DENO_MAKEFILE},
        {DENO_README_META, DENO_README},
        {DENO_GITIGNORE_META, DENO_GITIGNORE},
        {PYTHON_MAKEFILE_META, PYTHON_MAKEFILE},
        {PYTHON_README_META, PYTHON_README},
        {PYTHON_GITIGNORE_META, PYTHON_GITIGNORE},
    };
    return all;
}

} // namespace pmat::templates

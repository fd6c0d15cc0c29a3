#include <mcphub/dynamic/runtime_script.hpp>

namespace mcphub {

namespace {

// Requires Node.js >= 18.
constexpr const char* kScript = R"JS(#!/usr/bin/env node
'use strict';

const fs = require('fs');
const path = require('path');
const readline = require('readline');

const PROTOCOL_VERSION = '2024-11-05';

const dirFlag = process.argv.indexOf('--dir');
const serviceDir = dirFlag >= 0 ? process.argv[dirFlag + 1] : undefined;
if (!serviceDir) {
  process.stderr.write('usage: mcp-runtime.js --dir <service-dir>\n');
  process.exit(2);
}

let definition;
let handlers;
try {
  definition = JSON.parse(fs.readFileSync(path.join(serviceDir, 'definition.json'), 'utf8'));
  handlers = require(path.resolve(serviceDir, 'handlers.js'));
} catch (err) {
  process.stderr.write('cannot load service from ' + serviceDir + ': ' + err.message + '\n');
  process.exit(1);
}

function reply(id, body) {
  process.stdout.write(JSON.stringify(Object.assign({ jsonrpc: '2.0', id: id }, body)) + '\n');
}

function textResult(text, isError) {
  const result = { content: [{ type: 'text', text: text }] };
  if (isError) result.isError = true;
  return { result: result };
}

async function callTool(params) {
  const name = params && params.name;
  const handler = handlers[name];
  if (typeof handler !== 'function') {
    return textResult('Unknown tool: ' + name, true);
  }
  try {
    const value = await handler((params && params.arguments) || {});
    return textResult(typeof value === 'string' ? value : JSON.stringify(value, null, 2), false);
  } catch (err) {
    return textResult('Error: ' + (err && err.message ? err.message : String(err)), true);
  }
}

async function dispatch(message) {
  switch (message.method) {
    case 'initialize':
      return {
        result: {
          protocolVersion: PROTOCOL_VERSION,
          capabilities: { tools: {} },
          serverInfo: { name: definition.name || 'dynamic-service', version: '1.0.0' },
        },
      };
    case 'tools/list':
      return { result: { tools: definition.tools || [] } };
    case 'tools/call':
      return callTool(message.params);
    default:
      return { error: { code: -32601, message: 'Method not found: ' + message.method } };
  }
}

const input = readline.createInterface({ input: process.stdin, terminal: false });
input.on('line', async (line) => {
  if (!line.trim()) return;
  let message;
  try {
    message = JSON.parse(line);
  } catch (err) {
    return;
  }
  if (message === null || typeof message !== 'object' || !('id' in message)) return;
  try {
    reply(message.id, await dispatch(message));
  } catch (err) {
    reply(message.id, { error: { code: -32603, message: String(err && err.message) } });
  }
});
input.on('close', () => process.exit(0));

process.on('SIGTERM', () => process.exit(0));
process.on('SIGINT', () => process.exit(0));
)JS";

} // anonymous namespace

std::string_view RuntimeScript() {
    return kScript;
}

} // namespace mcphub

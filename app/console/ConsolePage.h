#pragma once

namespace ConsoleGate {

// Served at GET /. Posts the typed command to /api/exec and prints the reply.
inline const char* consolePageHtml() {
    return R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>ConsoleGate</title>
<style>
  body { font-family: monospace; background: #111; color: #ddd; margin: 2em; }
  #out { white-space: pre-wrap; border: 1px solid #333; padding: 1em; min-height: 12em; }
  #out.err { color: #f77; }
  input { width: 70%; font-family: monospace; background: #222; color: #eee; border: 1px solid #444; padding: .4em; }
  button { padding: .4em 1em; }
</style>
</head>
<body>
<h1>ConsoleGate</h1>
<form id="f">
  <input id="cmd" autocomplete="off" placeholder="email list --limit 10" autofocus>
  <button type="submit">Run</button>
</form>
<div id="out"></div>
<script>
document.getElementById('f').addEventListener('submit', async (ev) => {
  ev.preventDefault();
  const out = document.getElementById('out');
  out.className = '';
  out.textContent = 'running...';
  try {
    const res = await fetch('/api/exec', {
      method: 'POST',
      headers: { 'Content-Type': 'application/json' },
      body: JSON.stringify({ command: document.getElementById('cmd').value })
    });
    const data = await res.json();
    if (data.error !== undefined) {
      out.className = 'err';
      out.textContent = data.error;
    } else {
      out.textContent = data.output;
    }
  } catch (e) {
    out.className = 'err';
    out.textContent = String(e);
  }
});
</script>
</body>
</html>
)HTML";
}

} // namespace ConsoleGate
